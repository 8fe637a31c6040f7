#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QObject>

/**
 * Unified logging for Shirabe
 *
 * Every component logs through this singleton. A message is:
 * - written to the Qt message handler (qDebug/qInfo/qWarning/qCritical by level)
 * - emitted through logMessage() so an embedding application can mirror it
 *
 * Messages below the minimum level are dropped before formatting.
 *
 * Usage:
 *   LOG("[AniDB Send] Command queued");
 *   LOG_WARN(QString("Datagram dropped: %1").arg(reason));
 */
class Logger : public QObject
{
    Q_OBJECT

public:
    enum Level
    {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3
    };
    Q_ENUM(Level)

    /**
     * Log a message with source location
     *
     * @param msg The message to log
     * @param file Source file (only the file name is kept); may be empty
     * @param line Source line; ignored when <= 0
     * @param level Severity, Info unless stated
     */
    static void log(const QString &msg, const QString &file, int line, Level level = Info);

    static void setMinimumLevel(Level level);
    static Level minimumLevel();

    static Logger* instance();

signals:
    /**
     * Formatted message "[HH:mm:ss.zzz] [file:line] text"
     */
    void logMessage(QString message);

private:
    Logger();
};

#define LOG(msg) Logger::log(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) Logger::log(msg, __FILE__, __LINE__, Logger::Debug)
#define LOG_WARN(msg) Logger::log(msg, __FILE__, __LINE__, Logger::Warning)
#define LOG_ERROR(msg) Logger::log(msg, __FILE__, __LINE__, Logger::Error)

#endif // LOGGER_H
