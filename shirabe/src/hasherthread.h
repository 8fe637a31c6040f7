#ifndef HASHERTHREAD_H
#define HASHERTHREAD_H

#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <QString>
#include <QQueue>
#include "hash/ed2k.h"

/**
 * HasherThread - ed2k hashing off the event-loop thread
 *
 * Files are hashed one at a time in queue order on a dedicated Ed2kHasher.
 * Results and progress are signalled from the worker thread, so receivers
 * living on the main thread get them as queued calls.
 */
class HasherThread : public QThread
{
    Q_OBJECT
public:
    explicit HasherThread(QObject *parent = nullptr);
    ~HasherThread();

    void addFile(const QString &filePath);
    // Ends run() once the current file is done; queued files are dropped
    void stop();
    // Interrupt the file being hashed; it is reported as Stopped
    void stopHashing();

protected:
    void run() override;

signals:
    void threadStarted(Qt::HANDLE threadId);
    void notifyPartsDone(const QString &filePath, int total, int done);
    // status is an Ed2kHasher::Status; errorString is empty on Ok
    void fileHashed(const QString &filePath, int status, const Ed2kHasher::Result &result, const QString &errorString);

private:
    QMutex mutex;
    QWaitCondition condition;
    QQueue<QString> fileQueue;
    QString currentFile;
    bool shouldStop;
    Ed2kHasher *hasher;
};

#endif // HASHERTHREAD_H
