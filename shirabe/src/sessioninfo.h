#ifndef SESSIONINFO_H
#define SESSIONINFO_H

#include <QString>

/**
 * @brief SessionInfo - AniDB UDP session state
 *
 * Created by a successful AUTH. Holds the session key and the instant
 * (clock milliseconds) after which the key must not be used any more.
 * Invalidated on logout, on a 501/506 reply and on a ban.
 *
 * Usage:
 *   SessionInfo session;
 *   session.start(key, clock->nowMs() + 30 * 60 * 1000);
 *   if (session.isUsable(clock->nowMs()))
 *       command.add("s", session.key());
 */
class SessionInfo
{
public:
    /**
     * @brief Default constructor creates an invalid session
     */
    SessionInfo();

    /**
     * @brief Begin a session
     * @param key Session key from the 200/201 reply
     * @param expiresAtMs Clock time at which the key expires
     */
    void start(const QString& key, qint64 expiresAtMs);

    /**
     * @brief Mark the session unusable and clear the key
     */
    void invalidate();

    QString key() const { return m_key; }
    qint64 expiresAtMs() const { return m_expiresAtMs; }
    bool isValid() const { return m_valid; }

    /**
     * @brief Valid, holds a key and has not reached its expiry
     */
    bool isUsable(qint64 nowMs) const;

    // Key with all but the first characters hidden, for logging
    QString maskedKey() const;

private:
    QString m_key;
    qint64 m_expiresAtMs;
    bool m_valid;
};

#endif // SESSIONINFO_H
