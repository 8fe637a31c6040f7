#include "logger.h"
#include <QDebug>
#include <QDateTime>
#include <QMutex>
#include <QMutexLocker>
#include <atomic>

// Lives for the whole process; never deleted.
static Logger* s_instance = nullptr;
static QMutex s_instanceMutex;
static std::atomic<int> s_minimumLevel(Logger::Debug);

Logger::Logger() : QObject(nullptr)
{
}

Logger* Logger::instance()
{
    // QMutex gives the memory ordering the double check needs
    if (!s_instance)
    {
        QMutexLocker locker(&s_instanceMutex);
        if (!s_instance)
        {
            s_instance = new Logger();
        }
    }
    return s_instance;
}

void Logger::setMinimumLevel(Level level)
{
    s_minimumLevel.store(level);
}

Logger::Level Logger::minimumLevel()
{
    return static_cast<Level>(s_minimumLevel.load());
}

void Logger::log(const QString &msg, const QString &file, int line, Level level)
{
    if (level < s_minimumLevel.load())
    {
        return;
    }

    QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
    QString fullMessage;
    if (!file.isEmpty() && line > 0)
    {
        QString filename = file;
        int lastSlash = filename.lastIndexOf('/');
        if (lastSlash == -1)
        {
            lastSlash = filename.lastIndexOf('\\');
        }
        if (lastSlash >= 0)
        {
            filename = filename.mid(lastSlash + 1);
        }
        fullMessage = QString("[%1] [%2:%3] %4").arg(timestamp, filename).arg(line).arg(msg);
    }
    else
    {
        fullMessage = QString("[%1] %2").arg(timestamp, msg);
    }

    switch (level)
    {
    case Debug:
        qDebug().noquote() << fullMessage;
        break;
    case Info:
        qInfo().noquote() << fullMessage;
        break;
    case Warning:
        qWarning().noquote() << fullMessage;
        break;
    case Error:
        qCritical().noquote() << fullMessage;
        break;
    }

    emit instance()->logMessage(fullMessage);
}
