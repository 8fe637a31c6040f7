#include "sessioninfo.h"

SessionInfo::SessionInfo()
    : m_expiresAtMs(0)
    , m_valid(false)
{
}

void SessionInfo::start(const QString& key, qint64 expiresAtMs)
{
    m_key = key;
    m_expiresAtMs = expiresAtMs;
    m_valid = !key.isEmpty();
}

void SessionInfo::invalidate()
{
    m_key.clear();
    m_expiresAtMs = 0;
    m_valid = false;
}

bool SessionInfo::isUsable(qint64 nowMs) const
{
    return m_valid && !m_key.isEmpty() && nowMs < m_expiresAtMs;
}

QString SessionInfo::maskedKey() const
{
    if (m_key.isEmpty()) {
        return QString("<none>");
    }
    return m_key.left(3) + "...";
}
