#include "anidberror.h"

QString AniDBError::kindName(Kind kind)
{
    switch (kind) {
        case None: return "None";
        case IoError: return "IoError";
        case ProtocolFraming: return "ProtocolFraming";
        case AuthFailure: return "AuthFailure";
        case SessionExpired: return "SessionExpired";
        case Banned: return "Banned";
        case Timeout: return "Timeout";
        case ProtocolError: return "ProtocolError";
        case SocketError: return "SocketError";
        case ShutDown: return "ShutDown";
    }
    return "Unknown";
}

QString AniDBError::toString() const
{
    if (m_kind == None) {
        return "ok";
    }
    QString text = kindName(m_kind);
    if (m_code != 0) {
        text += QString(" (%1)").arg(m_code);
    }
    if (!m_message.isEmpty()) {
        text += ": " + m_message;
    }
    return text;
}
