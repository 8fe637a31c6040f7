#include "hasherthread.h"
#include "logger.h"

HasherThread::HasherThread(QObject *parent)
    : QThread(parent)
    , shouldStop(false)
    , hasher(new Ed2kHasher())
{
    // Runs on the worker thread, next to the hashing loop
    connect(hasher, &Ed2kHasher::notifyPartsDone, this, [this](int total, int done) {
        QString filePath;
        {
            QMutexLocker locker(&mutex);
            filePath = currentFile;
        }
        emit notifyPartsDone(filePath, total, done);
    }, Qt::DirectConnection);
}

HasherThread::~HasherThread()
{
    stop();
    stopHashing();
    wait();
    delete hasher;
}

void HasherThread::run()
{
    {
        QMutexLocker locker(&mutex);
        shouldStop = false;
    }

    LOG_DEBUG("[Hasher] Worker thread started");
    emit threadStarted(QThread::currentThreadId());

    for (;;)
    {
        QString filePath;
        {
            QMutexLocker locker(&mutex);
            while (fileQueue.isEmpty() && !shouldStop)
            {
                condition.wait(&mutex);
            }
            if (shouldStop)
            {
                break;
            }
            filePath = fileQueue.dequeue();
            currentFile = filePath;
        }

        int status = hasher->hashFile(filePath);
        Ed2kHasher::Result result;
        result.fileName = hasher->fileName();
        result.size = hasher->size();
        result.hexDigest = hasher->hexDigest();
        emit fileHashed(filePath, status, result,
            status == Ed2kHasher::Ok ? QString() : hasher->errorString());

        QMutexLocker locker(&mutex);
        currentFile.clear();
    }

    LOG_DEBUG("[Hasher] Worker thread finished");
}

void HasherThread::addFile(const QString &filePath)
{
    QMutexLocker locker(&mutex);
    fileQueue.enqueue(filePath);
    condition.wakeOne();
}

void HasherThread::stop()
{
    QMutexLocker locker(&mutex);
    shouldStop = true;
    fileQueue.clear();
    condition.wakeAll();
}

void HasherThread::stopHashing()
{
    // Ed2kHasher::stop only sets an atomic flag, safe from any thread
    hasher->stop();
}
