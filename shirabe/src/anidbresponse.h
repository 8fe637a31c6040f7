#ifndef ANIDBRESPONSE_H
#define ANIDBRESPONSE_H

#include <QString>
#include <QStringList>
#include <QByteArray>

/**
 * @brief One framed reply datagram from the AniDB UDP API
 *
 * The datagram is inflated first when it starts with the gzip magic 1f 8b.
 * The first line is then framed by three grammars, tried in order:
 *
 *   strict   TAG SP+ CODE SP* TEXT        TAG = 1*DIGIT, CODE = 3DIGIT
 *   salvage  TAG SP+ *(WORD SP+) CODE TEXT
 *            CODE is the first whitespace-delimited token after TAG made of
 *            exactly three digits (the server may echo request text first)
 *   tagless  CODE [SP TEXT]                e.g. "598 UNKNOWN COMMAND"
 *
 * Lines after the first form the payload. A datagram of TruncationThreshold
 * bytes or more (as received) is flagged truncated.
 */
class AniDBResponse
{
public:
	enum Grammar
	{
		Invalid = 0,
		Strict,
		Salvage,
		Tagless
	};

	static constexpr int TruncationThreshold = 1400;

	AniDBResponse();

	/**
	 * @brief Inflate (if needed) and frame a received datagram
	 *
	 * Never fails hard; check isValid() and errorString().
	 */
	static AniDBResponse parse(const QByteArray &datagram);

	/**
	 * @brief Frame already decoded text
	 */
	static AniDBResponse parseText(const QString &text);

	static bool matchStrict(const QString &firstLine, QString *tag, int *code, QString *text);
	static bool matchSalvage(const QString &firstLine, QString *tag, int *code, QString *text);
	static bool matchTagless(const QString &firstLine, int *code, QString *text);

	static bool isGzip(const QByteArray &data);
	/**
	 * @brief Inflate a gzip member with zlib
	 * @param ok false on a corrupt or incomplete stream
	 */
	static QByteArray inflateGzip(const QByteArray &data, bool *ok = nullptr);

	bool isValid() const { return m_grammar != Invalid; }
	Grammar grammar() const { return m_grammar; }
	QString tag() const { return m_tag; }
	int code() const { return m_code; }
	// Remainder of the first line after the code
	QString text() const { return m_text; }
	// Lines after the first
	QStringList payloadLines() const { return m_payloadLines; }
	// Data line of a record reply: the second line, or text() when absent
	QString dataLine() const;
	QString raw() const { return m_raw; }
	bool isTruncated() const { return m_truncated; }
	bool wasCompressed() const { return m_compressed; }
	QString errorString() const { return m_errorString; }

	bool isSuccess() const { return m_code >= 200 && m_code < 300; }

private:
	Grammar m_grammar;
	QString m_tag;
	int m_code;
	QString m_text;
	QStringList m_payloadLines;
	QString m_raw;
	bool m_truncated;
	bool m_compressed;
	QString m_errorString;
};

#endif // ANIDBRESPONSE_H
