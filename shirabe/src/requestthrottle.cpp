#include "requestthrottle.h"
#include "anidbclock.h"
#include "logger.h"
#include <utility>

RequestThrottle::RequestThrottle(AniDBClock *clock,
                                 const ApplicationSettings::ThrottleSettings &settings,
                                 QObject *parent)
    : QObject(parent)
    , m_clock(clock)
    , m_settings(settings)
    , m_scheduledTask(0)
    , m_shutDown(false)
    , m_generation(0)
{
}

RequestThrottle::~RequestThrottle()
{
    if (m_scheduledTask != 0)
        m_clock->cancel(m_scheduledTask);
}

void RequestThrottle::awaitTurn(const QString &label, TurnCallback callback, qint64 spacingMs)
{
    if (m_shutDown) {
        LOG_WARN(QString("[Throttle] %1 rejected, throttle is shut down").arg(label));
        callback(false);
        return;
    }

    Waiter waiter;
    waiter.label = label;
    waiter.spacingMs = qMax(m_settings.minSpacingMs, spacingMs);
    waiter.queuedAt = m_clock->nowMs();
    waiter.callback = std::move(callback);
    m_queue.append(waiter);
    pump();
}

void RequestThrottle::awaitFileTurn(const QString &label, TurnCallback callback)
{
    awaitTurn(label, std::move(callback), m_settings.fileSpacingMs);
}

void RequestThrottle::pump()
{
    if (m_state.busy || m_queue.isEmpty() || m_shutDown)
        return;

    m_state.busy = true;
    m_current = m_queue.takeFirst();
    begin();
}

void RequestThrottle::begin()
{
    const Waiter &waiter = m_current;
    const qint64 now = m_clock->nowMs();
    const bool firstRequest = m_state.lastRequestAt < 0;
    const qint64 elapsed = firstRequest ? -1 : now - m_state.lastRequestAt;
    const bool idleGap = !firstRequest && elapsed > m_settings.idleResetMs;

    qint64 wait = firstRequest ? 0 : qMax<qint64>(0, waiter.spacingMs - elapsed);
    if (wait == 0) {
        stamp(idleGap);
        return;
    }

    LOG_DEBUG(QString("[Throttle] %1 waits %2 ms").arg(waiter.label).arg(wait));
    const int generation = m_generation;
    m_scheduledTask = m_clock->schedule(wait, [this, idleGap, generation]() {
        if (generation != m_generation)
            return;
        m_scheduledTask = 0;
        stamp(idleGap);
    });
}

void RequestThrottle::stamp(bool idleGap)
{
    const qint64 now = m_clock->nowMs();
    m_state.lastRequestAt = now;

    if (m_state.bulkWindowStartedAt < 0 || idleGap) {
        if (idleGap)
            LOG_DEBUG("[Throttle] Idle gap, bulk window restarted");
        m_state.bulkWindowStartedAt = now;
        m_state.requestsInWindow = 1;
        release();
        return;
    }

    m_state.requestsInWindow++;
    if (now - m_state.bulkWindowStartedAt < m_settings.bulkWindowMs) {
        release();
        return;
    }

    LOG(QString("[Throttle] Bulk window open for %1 min (%2 requests), cooling down for %3 s")
        .arg((now - m_state.bulkWindowStartedAt) / 60000)
        .arg(m_state.requestsInWindow)
        .arg(m_settings.cooldownMs / 1000));
    m_state.coolingDown = true;
    emit cooldownStarted(m_settings.cooldownMs);

    const int generation = m_generation;
    m_scheduledTask = m_clock->schedule(m_settings.cooldownMs, [this, generation]() {
        if (generation != m_generation)
            return;
        m_scheduledTask = 0;
        const qint64 resumed = m_clock->nowMs();
        m_state.coolingDown = false;
        m_state.lastRequestAt = resumed;
        m_state.bulkWindowStartedAt = resumed;
        m_state.requestsInWindow = 1;
        release();
    });
}

void RequestThrottle::release()
{
    Waiter waiter = std::move(m_current);
    m_current = Waiter();
    m_state.busy = false;
    const qint64 waited = m_clock->nowMs() - waiter.queuedAt;
    emit turnGranted(waiter.label, waited);
    waiter.callback(true);
    pump();
}

ThrottleState RequestThrottle::state() const
{
    ThrottleState snapshot = m_state;
    snapshot.waiting = m_queue.size();
    return snapshot;
}

void RequestThrottle::resetBulkTracking()
{
    m_state.bulkWindowStartedAt = -1;
    m_state.requestsInWindow = 0;
}

void RequestThrottle::init()
{
    m_shutDown = false;
}

void RequestThrottle::shutdown()
{
    if (m_shutDown)
        return;

    m_shutDown = true;
    m_generation++;
    if (m_scheduledTask != 0) {
        m_clock->cancel(m_scheduledTask);
        m_scheduledTask = 0;
    }
    QList<Waiter> dropped;
    if (m_state.busy)
        dropped.append(std::move(m_current));
    m_current = Waiter();
    m_state.busy = false;
    m_state.coolingDown = false;

    dropped.append(m_queue);
    m_queue.clear();
    if (!dropped.isEmpty())
        LOG(QString("[Throttle] Shutdown, rejecting %1 queued request(s)").arg(dropped.size()));
    for (const Waiter &waiter : std::as_const(dropped))
        waiter.callback(false);
}
