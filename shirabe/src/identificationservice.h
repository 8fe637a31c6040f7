#ifndef IDENTIFICATIONSERVICE_H
#define IDENTIFICATIONSERVICE_H

#include "anidbapi.h"
#include "anidberror.h"
#include "anidbfileinfo.h"
#include "hash/ed2k.h"
#include <QObject>
#include <QString>
#include <QQueue>
#include <QPair>
#include <functional>

class AniDBHttpClient;
class HasherThread;

/**
 * @brief "What is this file?" for code outside the AniDB layer
 *
 * Hashes the file on a worker thread, makes sure the UDP client is initialized and logged in,
 * and looks the fingerprint up. Callers never touch AniDBApi state directly.
 *
 * When an HTTP client is given, it is consulted only after the UDP lookup
 * failed with Timeout, SocketError or ProtocolError. Banned and AuthFailure
 * are never sent to the fallback.
 */
class IdentificationService : public QObject
{
    Q_OBJECT

public:
    struct Fingerprint {
        QString hash;
        qint64 size;
        QString fileName;
        QString ed2kLink;
        Fingerprint() : size(0) {}
    };

    enum Source {
        NoSource = 0,
        UdpApi,
        HttpApi
    };

    struct Identification {
        QString path;
        Fingerprint fingerprint;
        bool found;
        AniDBFileInfo info;
        AniDBError error;
        Source source;
        Identification() : found(false), source(NoSource) {}
    };
    typedef std::function<void(const Identification &result)> IdentifyCallback;

    /**
     * @param api UDP client; must outlive the service
     * @param http Optional fallback; may be nullptr
     */
    explicit IdentificationService(AniDBApi *api, AniDBHttpClient *http = nullptr, QObject *parent = nullptr);
    // Pending identify() calls complete with ShutDown
    ~IdentificationService();

    /**
     * @brief Hash a file synchronously
     * @return Ed2kHasher::Status; on anything but Ok, error holds an IoError
     */
    int computeFileFingerprint(const QString &path, Fingerprint *out, AniDBError *error = nullptr);

    /**
     * @brief Look up a fingerprint the caller already has
     *
     * A hash that is not 32 hex digits completes with ProtocolError without
     * touching the network.
     */
    void identifyFile(const QString &hash, qint64 size, IdentifyCallback done);

    /**
     * @brief Hash and look up a file
     *
     * Returns at once; the hash runs on the worker thread and the lookup
     * continues on this object's thread when it is done.
     */
    void identify(const QString &path, IdentifyCallback done);

    void setHttpFallbackEnabled(bool enabled) { m_httpEnabled = enabled; }
    bool httpFallbackEnabled() const { return m_httpEnabled && m_http != nullptr; }

    static bool shouldFallBack(const AniDBError &error);
    static bool isValidHash(const QString &hash);

public slots:
    // Abort a running hash; identify() then completes with IoError
    void stopHashing();

signals:
    void hashingProgress(const QString &path, int totalParts, int partsDone);
    void fileIdentified(const QString &path, bool found);
    void fingerprintComputed(const QString &path, const QString &hash);

private slots:
    void onFileHashed(const QString &path, int status, const Ed2kHasher::Result &hash, const QString &errorString);

private:
    void lookup(const Identification &base, IdentifyCallback done);
    HasherThread *hasherThread();

    AniDBApi *m_api;
    AniDBHttpClient *m_http;
    bool m_httpEnabled;
    Ed2kHasher m_hasher;
    QString m_hashingPath;
    HasherThread *m_hasherThread;
    QQueue<QPair<QString, IdentifyCallback>> m_hashQueue;
};

#endif // IDENTIFICATIONSERVICE_H
