#ifndef ED2K_H
#define ED2K_H

#include "md4.h"
#include <QObject>
#include <QString>
#include <QByteArray>
#include <QIODevice>
#include <QMetaType>
#include <atomic>

/**
 * Ed2kHasher - streaming AniDB/eDonkey file fingerprint
 *
 * The input is cut into chunks of exactly ChunkSize bytes (the last chunk may
 * be shorter). Each chunk is MD4-hashed. A single chunk's digest is the
 * fingerprint; with two or more chunks the fingerprint is the MD4 of the
 * concatenated chunk digests. Empty input hashes as one empty chunk.
 *
 * At most one chunk's MD4 context plus one read block are held in memory.
 *
 * Usage:
 *   Ed2kHasher hasher;
 *   if (hasher.hashFile(path) == Ed2kHasher::Ok)
 *       qDebug() << hasher.hexDigest() << hasher.size();
 */
class Ed2kHasher : public QObject
{
	Q_OBJECT
public:
	static constexpr qint64 ChunkSize = 9728000;
	// Read granularity; ChunkSize is exactly 95 blocks
	static constexpr qint64 ReadBlockSize = 102400;
	// How long a sequential device may go without data before hashing fails
	static constexpr int StallTimeoutMs = 30000;

	enum Status
	{
		Ok = 1,
		OpenError = 2,
		Stopped = 3,
		ReadError = 4
	};

	struct Result
	{
		QString fileName;
		qint64 size;
		QString hexDigest;
		Result() : size(0) {}
	};

	explicit Ed2kHasher(QObject *parent = nullptr);

	/* === Streaming interface */
	void init();
	void update(const char *data, qint64 len);
	// Returns the 16-byte fingerprint; hexDigest() is valid afterwards
	QByteArray final();
	/* Streaming interface === */

	// Hash everything readable from an already opened device
	int hashDevice(QIODevice *device, qint64 expectedSize = -1);
	int hashFile(const QString &filePath);

	QString hexDigest() const { return m_hexDigest; }
	QByteArray digest() const { return m_digest; }
	qint64 size() const { return m_totalBytes; }
	QString fileName() const { return m_fileName; }
	QString errorString() const { return m_errorString; }
	// ed2k link of the last hashed file
	QString ed2kLink() const;
	int chunksHashed() const { return static_cast<int>(m_chunkDigests.size() / MD4::DigestLength); }

	static QByteArray md4(const QByteArray &data);
	static qint64 chunkCount(qint64 fileSize);
	static QString ed2kLink(const QString &fileName, qint64 size, const QString &hexDigest);

public slots:
	void stop();

signals:
	void notifyPartsDone(int total, int done);
	void notifyFileHashed(Ed2kHasher::Result);

private:
	MD4 m_chunkContext;
	qint64 m_bytesInChunk;
	qint64 m_totalBytes;
	QByteArray m_chunkDigests;
	QByteArray m_digest;
	QString m_hexDigest;
	QString m_fileName;
	QString m_errorString;
	QByteArray m_readBuffer;
	std::atomic<bool> m_stopRequested;

	void finishChunk();
};

Q_DECLARE_METATYPE(Ed2kHasher::Result)

#endif // ED2K_H
