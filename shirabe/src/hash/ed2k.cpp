#include "ed2k.h"
#include "../logger.h"
#include <QFile>
#include <QFileInfo>
#include <QUrl>

Ed2kHasher::Ed2kHasher(QObject *parent)
	: QObject(parent)
	, m_bytesInChunk(0)
	, m_totalBytes(0)
	, m_stopRequested(false)
{
}

qint64 Ed2kHasher::chunkCount(qint64 fileSize)
{
	// An empty file still counts as one (empty) chunk
	if(fileSize <= 0)
	{
		return 1;
	}
	return (fileSize + ChunkSize - 1) / ChunkSize;
}

QByteArray Ed2kHasher::md4(const QByteArray &data)
{
	unsigned char out[MD4::DigestLength];
	MD4::Digest(reinterpret_cast<const unsigned char *>(data.constData()), static_cast<size_t>(data.size()), out);
	return QByteArray(reinterpret_cast<const char *>(out), MD4::DigestLength);
}

void Ed2kHasher::init()
{
	m_chunkContext.Init();
	m_bytesInChunk = 0;
	m_totalBytes = 0;
	m_chunkDigests.clear();
	m_digest.clear();
	m_hexDigest.clear();
	m_errorString.clear();
}

void Ed2kHasher::finishChunk()
{
	unsigned char out[MD4::DigestLength];
	m_chunkContext.Final(out);
	m_chunkDigests.append(reinterpret_cast<const char *>(out), MD4::DigestLength);
	m_bytesInChunk = 0;
}

void Ed2kHasher::update(const char *data, qint64 len)
{
	while(len > 0)
	{
		qint64 take = qMin(len, ChunkSize - m_bytesInChunk);
		m_chunkContext.Update(reinterpret_cast<const unsigned char *>(data), static_cast<size_t>(take));
		m_bytesInChunk += take;
		m_totalBytes += take;
		data += take;
		len -= take;
		if(m_bytesInChunk == ChunkSize)
		{
			finishChunk();
		}
	}
}

QByteArray Ed2kHasher::final()
{
	// A partial tail, or the single empty chunk of an empty input.
	// A file of exactly N chunks gets no trailing empty chunk.
	if(m_bytesInChunk > 0 || m_chunkDigests.isEmpty())
	{
		finishChunk();
	}

	if(m_chunkDigests.size() == MD4::DigestLength)
	{
		m_digest = m_chunkDigests;
	}
	else
	{
		m_digest = md4(m_chunkDigests);
	}
	m_hexDigest = QString::fromLatin1(m_digest.toHex());
	return m_digest;
}

int Ed2kHasher::hashDevice(QIODevice *device, qint64 expectedSize)
{
	m_stopRequested = false;
	init();

	if(device == nullptr || !device->isOpen() || !device->isReadable())
	{
		m_errorString = QString("Device is not open for reading");
		return OpenError;
	}

	int totalParts = expectedSize >= 0 ? static_cast<int>(chunkCount(expectedSize)) : 0;
	int partsDone = 0;
	m_readBuffer.resize(ReadBlockSize);

	for(;;)
	{
		if(m_stopRequested)
		{
			LOG("[Ed2k] Hashing stopped by request");
			m_errorString = QString("Hashing stopped");
			return Stopped;
		}

		// Never read across a chunk boundary
		qint64 want = qMin(ReadBlockSize, ChunkSize - m_bytesInChunk);
		qint64 got = device->read(m_readBuffer.data(), want);
		if(got < 0)
		{
			m_errorString = device->errorString();
			LOG_WARN(QString("[Ed2k] Read error after %1 bytes: %2").arg(m_totalBytes).arg(m_errorString));
			return ReadError;
		}
		if(got == 0)
		{
			if(device->atEnd() || !device->isSequential())
			{
				break;
			}
			if(!device->waitForReadyRead(StallTimeoutMs) && !device->atEnd())
			{
				m_errorString = QString("Device stalled after %1 bytes").arg(m_totalBytes);
				LOG_WARN("[Ed2k] " + m_errorString);
				return ReadError;
			}
			continue;
		}

		int before = chunksHashed();
		update(m_readBuffer.constData(), got);
		if(chunksHashed() != before)
		{
			partsDone = chunksHashed();
			emit notifyPartsDone(totalParts, partsDone);
		}
	}

	final();
	if(chunksHashed() != partsDone)
	{
		emit notifyPartsDone(totalParts > 0 ? totalParts : chunksHashed(), chunksHashed());
	}
	return Ok;
}

int Ed2kHasher::hashFile(const QString &filePath)
{
	QFileInfo fileinfo(filePath);
	m_fileName = fileinfo.fileName();

	QFile file(fileinfo.absoluteFilePath());
	if(!fileinfo.exists() || !file.open(QIODevice::ReadOnly))
	{
		init();
		m_errorString = fileinfo.exists()
			? QString("File %1 cannot be opened: %2").arg(fileinfo.absoluteFilePath(), file.errorString())
			: QString("File %1 does not exist.").arg(fileinfo.absoluteFilePath());
		LOG_WARN("[Ed2k] " + m_errorString);
		return OpenError;
	}

	int status = hashDevice(&file, file.size());
	file.close();
	if(status != Ok)
	{
		return status;
	}

	Result hash;
	hash.fileName = m_fileName;
	hash.size = m_totalBytes;
	hash.hexDigest = m_hexDigest;
	LOG_DEBUG(QString("[Ed2k] %1 size=%2 chunks=%3 hash=%4").arg(hash.fileName).arg(hash.size).arg(chunksHashed()).arg(hash.hexDigest));
	emit notifyFileHashed(hash);
	return Ok;
}

QString Ed2kHasher::ed2kLink() const
{
	return ed2kLink(m_fileName, m_totalBytes, m_hexDigest);
}

QString Ed2kHasher::ed2kLink(const QString &fileName, qint64 size, const QString &hexDigest)
{
	return QString("ed2k://|file|%1|%2|%3|/")
		.arg(QString::fromUtf8(QUrl::toPercentEncoding(fileName)))
		.arg(size)
		.arg(hexDigest.toUpper());
}

void Ed2kHasher::stop()
{
	m_stopRequested = true;
}
