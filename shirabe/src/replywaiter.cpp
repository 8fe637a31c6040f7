#include "replywaiter.h"
#include "anidbclock.h"
#include "logger.h"
#include <QStringList>
#include <utility>

ReplyWaiter::ReplyWaiter(AniDBClock *clock)
    : m_clock(clock)
{
}

ReplyWaiter::~ReplyWaiter()
{
    for (auto it = m_pending.cbegin(); it != m_pending.cend(); ++it)
        m_clock->cancel(it.value().timeoutTask);
    m_pending.clear();
}

bool ReplyWaiter::add(const QString &tag, const QString &description, qint64 timeoutMs, Completion done)
{
    if (m_pending.contains(tag)) {
        LOG_WARN(QString("[AniDB Send] Tag %1 is already pending").arg(tag));
        return false;
    }

    Entry entry;
    entry.description = description;
    entry.done = std::move(done);
    entry.timeoutTask = m_clock->schedule(timeoutMs, [this, tag]() { onTimeout(tag); });
    m_pending.insert(tag, entry);
    return true;
}

bool ReplyWaiter::settle(const QString &tag, const AniDBResponse &reply)
{
    auto it = m_pending.find(tag);
    if (it == m_pending.end())
        return false;

    Entry entry = it.value();
    m_pending.erase(it);
    m_clock->cancel(entry.timeoutTask);
    entry.done(reply, AniDBError());
    return true;
}

bool ReplyWaiter::fail(const QString &tag, const AniDBError &error)
{
    auto it = m_pending.find(tag);
    if (it == m_pending.end())
        return false;

    Entry entry = it.value();
    m_pending.erase(it);
    m_clock->cancel(entry.timeoutTask);
    entry.done(AniDBResponse(), error);
    return true;
}

void ReplyWaiter::failAll(const AniDBError &error)
{
    // Callbacks may add new entries; only the ones pending now are failed
    const QStringList tags = m_pending.keys();
    for (const QString &tag : tags)
        fail(tag, error);
}

QString ReplyWaiter::description(const QString &tag) const
{
    return m_pending.value(tag).description;
}

void ReplyWaiter::onTimeout(const QString &tag)
{
    auto it = m_pending.find(tag);
    if (it == m_pending.end())
        return;

    Entry entry = it.value();
    m_pending.erase(it);
    LOG_WARN(QString("[AniDB Timeout] No reply for tag %1 (%2)").arg(tag, entry.description));
    entry.done(AniDBResponse(), AniDBError(AniDBError::Timeout,
        QString("no reply to %1 within the command timeout").arg(entry.description)));
}
