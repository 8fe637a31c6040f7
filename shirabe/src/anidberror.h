#ifndef ANIDBERROR_H
#define ANIDBERROR_H

#include <QString>
#include <QMetaType>

/**
 * @brief Outcome of an AniDB operation
 *
 * Asynchronous operations never throw; they complete once with a value
 * carrying one of these. A lookup that finds nothing is not an error.
 */
class AniDBError
{
public:
    enum Kind
    {
        None = 0,
        IoError,            // source file unreadable
        ProtocolFraming,    // reply could not be framed even by the salvage grammar
        AuthFailure,        // 500/503/504/505
        SessionExpired,     // 501/506
        Banned,             // 555 or the ban overlay is still active
        Timeout,            // no reply within the command deadline
        ProtocolError,      // any other unexpected reply code
        SocketError,        // send failed or host could not be resolved
        ShutDown            // client stopped while the command was pending
    };

    AniDBError() : m_kind(None), m_code(0) {}
    AniDBError(Kind kind, const QString &message, int code = 0)
        : m_kind(kind), m_message(message), m_code(code) {}

    Kind kind() const { return m_kind; }
    QString message() const { return m_message; }
    // Reply code that caused the error, 0 if none
    int code() const { return m_code; }

    bool isError() const { return m_kind != None; }
    explicit operator bool() const { return isError(); }

    QString toString() const;
    static QString kindName(Kind kind);

private:
    Kind m_kind;
    QString m_message;
    int m_code;
};

Q_DECLARE_METATYPE(AniDBError)

#endif // ANIDBERROR_H
