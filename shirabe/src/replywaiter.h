#ifndef REPLYWAITER_H
#define REPLYWAITER_H

#include "anidberror.h"
#include "anidbresponse.h"
#include <QHash>
#include <QString>
#include <functional>

class AniDBClock;

/**
 * @class ReplyWaiter
 * @brief Commands sent and still waiting for their reply, keyed by tag
 *
 * Each entry owns a completion callback and a deadline scheduled on the
 * clock. An entry settles exactly once: by settle() when its reply arrives,
 * by its deadline (Timeout), or by fail()/failAll(). Settling removes the
 * entry and cancels its deadline before the callback runs, so a callback may
 * freely register new commands.
 */
class ReplyWaiter
{
public:
    typedef std::function<void(const AniDBResponse &reply, const AniDBError &error)> Completion;

    /**
     * @param clock Schedules deadlines; must outlive the waiter
     */
    explicit ReplyWaiter(AniDBClock *clock);
    ~ReplyWaiter();

    ReplyWaiter(const ReplyWaiter &) = delete;
    ReplyWaiter &operator=(const ReplyWaiter &) = delete;

    /**
     * @brief Start waiting for a reply
     * @param tag Unique tag of the sent command
     * @param timeoutMs Deadline after which the entry fails with Timeout
     * @return false if the tag is already pending
     */
    bool add(const QString &tag, const QString &description, qint64 timeoutMs, Completion done);

    /**
     * @brief Deliver a reply to its entry
     * @return false if nothing waits on the tag
     */
    bool settle(const QString &tag, const AniDBResponse &reply);

    /**
     * @brief Complete one entry with an error
     */
    bool fail(const QString &tag, const AniDBError &error);

    /**
     * @brief Complete every entry with the same error
     */
    void failAll(const AniDBError &error);

    bool isPending(const QString &tag) const { return m_pending.contains(tag); }
    int pendingCount() const { return m_pending.size(); }
    QString description(const QString &tag) const;

private:
    struct Entry
    {
        QString description;
        int timeoutTask;
        Completion done;
    };

    void onTimeout(const QString &tag);

    AniDBClock *m_clock;
    QHash<QString, Entry> m_pending;
};

#endif // REPLYWAITER_H
