#include "anidbclock.h"
#include <QTimer>
#include <utility>

SystemClock::SystemClock(QObject *parent)
    : QObject(parent)
    , m_nextId(1)
{
    m_monotonic.start();
}

SystemClock::~SystemClock()
{
    for (QTimer *timer : std::as_const(m_timers))
    {
        timer->stop();
        delete timer;
    }
    m_timers.clear();
}

qint64 SystemClock::nowMs() const
{
    return m_monotonic.elapsed();
}

int SystemClock::schedule(qint64 delayMs, std::function<void()> task)
{
    int id = m_nextId++;
    if (m_nextId <= 0)
    {
        m_nextId = 1;
    }

    QTimer *timer = new QTimer(this);
    timer->setSingleShot(true);
    timer->setTimerType(Qt::PreciseTimer);
    timer->setInterval(static_cast<int>(qMax<qint64>(0, delayMs)));
    connect(timer, &QTimer::timeout, this, [this, id, task]() {
        QTimer *fired = m_timers.take(id);
        if (fired == nullptr)
        {
            return;
        }
        fired->deleteLater();
        task();
    });
    m_timers.insert(id, timer);
    timer->start();
    return id;
}

void SystemClock::cancel(int taskId)
{
    QTimer *timer = m_timers.take(taskId);
    if (timer != nullptr)
    {
        timer->stop();
        timer->deleteLater();
    }
}
