#include "anidbresponse.h"
#include "logger.h"
#include <QRegularExpression>
#include <zlib.h>

namespace {

bool isCodeToken(const QString &token)
{
	if (token.size() != 3)
		return false;
	for (const QChar &c : token)
	{
		if (!c.isDigit())
			return false;
	}
	return true;
}

}

AniDBResponse::AniDBResponse()
	: m_grammar(Invalid)
	, m_code(0)
	, m_truncated(false)
	, m_compressed(false)
{
}

bool AniDBResponse::isGzip(const QByteArray &data)
{
	return data.size() > 2 &&
		static_cast<unsigned char>(data[0]) == 0x1f &&
		static_cast<unsigned char>(data[1]) == 0x8b;
}

QByteArray AniDBResponse::inflateGzip(const QByteArray &data, bool *ok)
{
	QByteArray result;
	if (ok)
		*ok = false;

	z_stream stream;
	stream.zalloc = Z_NULL;
	stream.zfree = Z_NULL;
	stream.opaque = Z_NULL;
	stream.avail_in = static_cast<uInt>(data.size());
	stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.constData()));

	// windowBits = 15 (default) + 16 (gzip format) = 31
	int ret = inflateInit2(&stream, 15 + 16);
	if (ret != Z_OK)
	{
		LOG_WARN(QString("[AniDB Recv] Failed to initialize gzip decompression: %1").arg(ret));
		return result;
	}

	const int CHUNK = 16 * 1024;
	char out[CHUNK];
	do {
		stream.avail_out = CHUNK;
		stream.next_out = reinterpret_cast<Bytef*>(out);

		ret = inflate(&stream, Z_NO_FLUSH);
		if (ret == Z_STREAM_ERROR || ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR)
		{
			LOG_WARN(QString("[AniDB Recv] Gzip decompression failed: %1").arg(ret));
			inflateEnd(&stream);
			return QByteArray();
		}
		result.append(out, CHUNK - static_cast<int>(stream.avail_out));
		// Input exhausted without reaching the end of the member
		if (ret == Z_BUF_ERROR || (stream.avail_in == 0 && ret != Z_STREAM_END && stream.avail_out != 0))
		{
			LOG_WARN("[AniDB Recv] Gzip stream is incomplete");
			inflateEnd(&stream);
			return QByteArray();
		}
	} while (ret != Z_STREAM_END);

	inflateEnd(&stream);
	if (ok)
		*ok = true;
	return result;
}

bool AniDBResponse::matchStrict(const QString &firstLine, QString *tag, int *code, QString *text)
{
	static const QRegularExpression strict("^(\\d+)\\s+(\\d{3})(?:\\s+(.*))?$");
	QRegularExpressionMatch match = strict.match(firstLine);
	if (!match.hasMatch())
		return false;
	if (tag)
		*tag = match.captured(1);
	if (code)
		*code = match.captured(2).toInt();
	if (text)
		*text = match.captured(3).trimmed();
	return true;
}

bool AniDBResponse::matchSalvage(const QString &firstLine, QString *tag, int *code, QString *text)
{
	static const QRegularExpression tagPrefix("^(\\d+)\\s+");
	QRegularExpressionMatch tagMatch = tagPrefix.match(firstLine);
	if (!tagMatch.hasMatch())
		return false;

	QString afterTag = firstLine.mid(tagMatch.capturedLength(0));
	static const QRegularExpression token("\\S+");
	QRegularExpressionMatchIterator it = token.globalMatch(afterTag);
	while (it.hasNext())
	{
		QRegularExpressionMatch t = it.next();
		if (!isCodeToken(t.captured(0)))
			continue;
		if (tag)
			*tag = tagMatch.captured(1);
		if (code)
			*code = t.captured(0).toInt();
		if (text)
			*text = afterTag.mid(t.capturedEnd(0)).trimmed();
		return true;
	}
	return false;
}

bool AniDBResponse::matchTagless(const QString &firstLine, int *code, QString *text)
{
	static const QRegularExpression tagless("^(\\d{3})(?:\\s+(.*))?$");
	QRegularExpressionMatch match = tagless.match(firstLine);
	if (!match.hasMatch())
		return false;
	if (code)
		*code = match.captured(1).toInt();
	if (text)
		*text = match.captured(2).trimmed();
	return true;
}

AniDBResponse AniDBResponse::parse(const QByteArray &datagram)
{
	QByteArray data = datagram;
	bool compressed = false;
	if (isGzip(datagram))
	{
		bool ok = false;
		data = inflateGzip(datagram, &ok);
		if (!ok)
		{
			AniDBResponse failed;
			failed.m_compressed = true;
			failed.m_truncated = datagram.size() >= TruncationThreshold;
			failed.m_errorString = "corrupt gzip datagram";
			return failed;
		}
		compressed = true;
	}

	AniDBResponse response = parseText(QString::fromUtf8(data));
	response.m_compressed = compressed;
	response.m_truncated = datagram.size() >= TruncationThreshold;
	return response;
}

AniDBResponse AniDBResponse::parseText(const QString &text)
{
	AniDBResponse response;
	response.m_raw = text.trimmed();

	QStringList lines = response.m_raw.split('\n');
	for (QString &line : lines)
	{
		if (line.endsWith('\r'))
			line.chop(1);
	}
	QString firstLine = lines.value(0).trimmed();

	if (matchStrict(firstLine, &response.m_tag, &response.m_code, &response.m_text))
	{
		response.m_grammar = Strict;
	}
	else if (matchSalvage(firstLine, &response.m_tag, &response.m_code, &response.m_text))
	{
		response.m_grammar = Salvage;
	}
	else if (matchTagless(firstLine, &response.m_code, &response.m_text))
	{
		response.m_grammar = Tagless;
		response.m_tag.clear();
	}
	else
	{
		response.m_errorString = QString("unframed reply: %1").arg(firstLine.left(80));
		return response;
	}

	lines.removeFirst();
	response.m_payloadLines = lines;
	return response;
}

QString AniDBResponse::dataLine() const
{
	if (!m_payloadLines.isEmpty())
		return m_payloadLines.first();
	return m_text;
}
