#ifndef REQUESTTHROTTLE_H
#define REQUESTTHROTTLE_H

#include "applicationsettings.h"
#include <QObject>
#include <QString>
#include <QList>
#include <functional>

class AniDBClock;

/**
 * @brief Snapshot of the throttle bookkeeping; times are clock milliseconds, -1 = never
 */
struct ThrottleState
{
    qint64 lastRequestAt;
    qint64 bulkWindowStartedAt;
    int requestsInWindow;
    bool busy;
    bool coolingDown;
    int waiting;

    ThrottleState()
        : lastRequestAt(-1)
        , bulkWindowStartedAt(-1)
        , requestsInWindow(0)
        , busy(false)
        , coolingDown(false)
        , waiting(0) {}
};

/**
 * @brief Single gate every AniDB request passes before going on the wire
 *
 * One instance per process, owned by whoever owns the AniDB clients and
 * handed to each of them. awaitTurn() never blocks: the callback runs on the
 * event loop once the turn is granted. At most one caller holds the gate;
 * the others wait in arrival order.
 *
 * Once granted, a caller waits out the remaining spacing since the previous
 * request, stamps the request time and updates the bulk window. A gap longer
 * than idleResetMs restarts the window; a window open for bulkWindowMs costs
 * one cooldownMs pause, after which a new window starts.
 *
 * Only requests inside this process are coordinated.
 */
class RequestThrottle : public QObject
{
    Q_OBJECT

public:
    // granted is false only when the throttle was shut down while waiting
    typedef std::function<void(bool granted)> TurnCallback;

    RequestThrottle(AniDBClock *clock,
                    const ApplicationSettings::ThrottleSettings &settings,
                    QObject *parent = nullptr);
    ~RequestThrottle() override;

    /**
     * @brief Wait for the next request slot
     * @param label Shown in the log
     * @param spacingMs Minimum gap since the previous request; below
     *        minSpacingMs (or -1) means minSpacingMs
     */
    void awaitTurn(const QString &label, TurnCallback callback, qint64 spacingMs = -1);

    /**
     * @brief awaitTurn() with the FILE command spacing
     */
    void awaitFileTurn(const QString &label, TurnCallback callback);

    ThrottleState state() const;

    /**
     * @brief Close the bulk window; the next request opens a new one
     */
    void resetBulkTracking();

    /**
     * @brief Accept callers again after shutdown()
     */
    void init();

    /**
     * @brief Cancel the pending wait and reject every queued caller
     */
    void shutdown();

    bool isShutDown() const { return m_shutDown; }
    const ApplicationSettings::ThrottleSettings &settings() const { return m_settings; }

signals:
    void cooldownStarted(qint64 durationMs);
    void turnGranted(const QString &label, qint64 waitedMs);

private:
    struct Waiter
    {
        QString label;
        qint64 spacingMs = 0;
        qint64 queuedAt = 0;
        TurnCallback callback;
    };

    void pump();
    void begin();
    void stamp(bool idleGap);
    void release();

    AniDBClock *m_clock;
    ApplicationSettings::ThrottleSettings m_settings;
    ThrottleState m_state;
    QList<Waiter> m_queue;
    // Holder of the gate while busy
    Waiter m_current;
    int m_scheduledTask;
    bool m_shutDown;
    // Bumped on shutdown so stale scheduled continuations do nothing
    int m_generation;
};

#endif // REQUESTTHROTTLE_H
