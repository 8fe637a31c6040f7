#ifndef ANIDBCLOCK_H
#define ANIDBCLOCK_H

#include <QObject>
#include <QElapsedTimer>
#include <QHash>
#include <functional>

class QTimer;

/**
 * @brief Time source and deferred-task scheduler
 *
 * Every delay in the AniDB stack (throttle waits, cooldowns, command
 * deadlines, session and ban expiry) goes through this interface so the
 * whole state machine can be driven by virtual time in tests.
 */
class AniDBClock
{
public:
    virtual ~AniDBClock() = default;

    /**
     * @brief Monotonic milliseconds; only differences are meaningful
     */
    virtual qint64 nowMs() const = 0;

    /**
     * @brief Run task once after delayMs on the event loop
     * @return Id usable with cancel(), never 0
     */
    virtual int schedule(qint64 delayMs, std::function<void()> task) = 0;

    /**
     * @brief Drop a scheduled task; unknown or already fired ids are ignored
     */
    virtual void cancel(int taskId) = 0;
};

/**
 * @brief AniDBClock backed by QElapsedTimer and single-shot QTimers
 */
class SystemClock : public QObject, public AniDBClock
{
    Q_OBJECT

public:
    explicit SystemClock(QObject *parent = nullptr);
    ~SystemClock() override;

    qint64 nowMs() const override;
    int schedule(qint64 delayMs, std::function<void()> task) override;
    void cancel(int taskId) override;

    int pendingTasks() const { return m_timers.size(); }

private:
    QElapsedTimer m_monotonic;
    QHash<int, QTimer*> m_timers;
    int m_nextId;
};

#endif // ANIDBCLOCK_H
