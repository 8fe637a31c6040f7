#include "identificationservice.h"
#include "anidbhttpclient.h"
#include "hasherthread.h"
#include "logger.h"
#include <QPointer>
#include <QRegularExpression>

IdentificationService::IdentificationService(AniDBApi *api, AniDBHttpClient *http, QObject *parent)
    : QObject(parent)
    , m_api(api)
    , m_http(http)
    , m_httpEnabled(http != nullptr)
    , m_hasherThread(nullptr)
{
    connect(&m_hasher, &Ed2kHasher::notifyPartsDone, this, [this](int total, int done) {
        emit hashingProgress(m_hashingPath, total, done);
    });
}

IdentificationService::~IdentificationService()
{
    delete m_hasherThread;
    m_hasherThread = nullptr;

    while (!m_hashQueue.isEmpty()) {
        QPair<QString, IdentifyCallback> pending = m_hashQueue.dequeue();
        Identification result;
        result.path = pending.first;
        result.error = AniDBError(AniDBError::ShutDown, "identification service destroyed");
        pending.second(result);
    }
}

HasherThread *IdentificationService::hasherThread()
{
    if (m_hasherThread == nullptr) {
        m_hasherThread = new HasherThread();
        connect(m_hasherThread, &HasherThread::notifyPartsDone, this, &IdentificationService::hashingProgress,
                Qt::QueuedConnection);
        connect(m_hasherThread, &HasherThread::fileHashed, this, &IdentificationService::onFileHashed,
                Qt::QueuedConnection);
        m_hasherThread->start();
    }
    return m_hasherThread;
}

int IdentificationService::computeFileFingerprint(const QString &path, Fingerprint *out, AniDBError *error)
{
    m_hashingPath = path;
    int status = m_hasher.hashFile(path);
    m_hashingPath.clear();

    if (status != Ed2kHasher::Ok) {
        QString reason = status == Ed2kHasher::Stopped ? QString("hashing stopped") : m_hasher.errorString();
        LOG_WARN(QString("[Identify] Cannot hash %1: %2").arg(path, reason));
        if (error)
            *error = AniDBError(AniDBError::IoError, reason);
        return status;
    }

    if (out) {
        out->hash = m_hasher.hexDigest();
        out->size = m_hasher.size();
        out->fileName = m_hasher.fileName();
        out->ed2kLink = m_hasher.ed2kLink();
    }
    return status;
}

void IdentificationService::stopHashing()
{
    m_hasher.stop();
    if (m_hasherThread)
        m_hasherThread->stopHashing();
}

bool IdentificationService::isValidHash(const QString &hash)
{
    static const QRegularExpression hex32("^[0-9A-Fa-f]{32}$");
    return hex32.match(hash).hasMatch();
}

bool IdentificationService::shouldFallBack(const AniDBError &error)
{
    switch (error.kind()) {
        case AniDBError::Timeout:
        case AniDBError::SocketError:
        case AniDBError::ProtocolError:
            return true;
        default:
            return false;
    }
}

void IdentificationService::identify(const QString &path, IdentifyCallback done)
{
    m_hashQueue.enqueue(qMakePair(path, done));
    hasherThread()->addFile(path);
}

void IdentificationService::onFileHashed(const QString &path, int status, const Ed2kHasher::Result &hash,
                                         const QString &errorString)
{
    if (m_hashQueue.isEmpty() || m_hashQueue.head().first != path) {
        LOG_WARN(QString("[Identify] Unexpected hash result for %1").arg(path));
        return;
    }
    IdentifyCallback done = m_hashQueue.dequeue().second;

    Identification result;
    result.path = path;
    if (status != Ed2kHasher::Ok) {
        QString reason = status == Ed2kHasher::Stopped ? QString("hashing stopped") : errorString;
        LOG_WARN(QString("[Identify] Cannot hash %1: %2").arg(path, reason));
        result.error = AniDBError(AniDBError::IoError, reason);
        emit fileIdentified(path, false);
        done(result);
        return;
    }

    result.fingerprint.hash = hash.hexDigest;
    result.fingerprint.size = hash.size;
    result.fingerprint.fileName = hash.fileName;
    result.fingerprint.ed2kLink = Ed2kHasher::ed2kLink(hash.fileName, hash.size, hash.hexDigest);
    LOG(QString("[Identify] %1 -> %2 (%3 bytes)").arg(path, hash.hexDigest).arg(hash.size));
    emit fingerprintComputed(path, hash.hexDigest);
    lookup(result, done);
}

void IdentificationService::identifyFile(const QString &hash, qint64 size, IdentifyCallback done)
{
    Identification result;
    result.fingerprint.hash = hash.toLower();
    result.fingerprint.size = size;
    if (!isValidHash(hash)) {
        LOG_WARN(QString("[Identify] Rejecting malformed ed2k hash '%1'").arg(hash));
        result.error = AniDBError(AniDBError::ProtocolError,
            QString("Malformed ed2k hash '%1': expected 32 hex digits").arg(hash));
        emit fileIdentified(result.path, false);
        done(result);
        return;
    }
    lookup(result, done);
}

void IdentificationService::lookup(const Identification &base, IdentifyCallback done)
{
    if (!m_api->isInitialized()) {
        QString reason;
        if (!m_api->init(&reason)) {
            Identification result = base;
            result.error = AniDBError(AniDBError::SocketError, reason);
            if (!httpFallbackEnabled()) {
                emit fileIdentified(result.path, false);
                done(result);
                return;
            }
        }
    }

    QPointer<IdentificationService> self(this);
    auto finish = [self, done](const Identification &result) {
        if (!self.isNull())
            emit self->fileIdentified(result.path, result.found);
        done(result);
    };

    auto viaHttp = [self, base, finish](const AniDBError &udpError) {
        if (self.isNull()) {
            Identification result = base;
            result.error = udpError;
            finish(result);
            return;
        }
        LOG(QString("[Identify] UDP lookup failed (%1), trying HTTP").arg(udpError.toString()));
        self->m_http->lookupFile(base.fingerprint.hash, base.fingerprint.size,
            [base, finish, udpError](const AniDBApi::LookupResult &lookup) {
                Identification result = base;
                result.found = lookup.found;
                result.info = lookup.info;
                result.error = lookup.error;
                result.source = HttpApi;
                if (lookup.error) {
                    LOG_WARN(QString("[Identify] HTTP fallback failed too: %1").arg(lookup.error.toString()));
                    result.error = AniDBError(lookup.error.kind(),
                        QString("%1; UDP: %2").arg(lookup.error.message(), udpError.toString()),
                        lookup.error.code());
                }
                finish(result);
            });
    };

    if (!m_api->isInitialized()) {
        viaHttp(AniDBError(AniDBError::SocketError, "UDP client unavailable"));
        return;
    }

    m_api->lookupFile(base.fingerprint.hash, base.fingerprint.size,
        [self, base, finish, viaHttp](const AniDBApi::LookupResult &lookup) {
            if (lookup.error && !self.isNull() && self->httpFallbackEnabled() && shouldFallBack(lookup.error)) {
                viaHttp(lookup.error);
                return;
            }
            Identification result = base;
            result.found = lookup.found;
            result.info = lookup.info;
            result.error = lookup.error;
            result.source = UdpApi;
            finish(result);
        });
}
