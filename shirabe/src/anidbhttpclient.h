#ifndef ANIDBHTTPCLIENT_H
#define ANIDBHTTPCLIENT_H

#include "anidbapi.h"
#include "applicationsettings.h"
#include <QObject>
#include <QUrl>

class QNetworkAccessManager;
class RequestThrottle;

/**
 * @brief Best-effort FILE lookup over the AniDB HTTP API
 *
 * Used only when the UDP client cannot answer. No session: every request
 * carries the client name and version. Requests wait their turn on the same
 * RequestThrottle as the UDP client.
 */
class AniDBHttpClient : public QObject
{
    Q_OBJECT

public:
    AniDBHttpClient(const ApplicationSettings &settings,
                    RequestThrottle *throttle,
                    QObject *parent = nullptr);

    void lookupFile(const QString &ed2k, qint64 size, AniDBApi::LookupCallback done);

    QUrl fileRequestUrl(const QString &ed2k, qint64 size) const;

    /**
     * @brief Parse a (possibly gzipped) FILE reply body
     *
     * An <error> element mentioning "No such file" is a negative result;
     * any other <error> is a ProtocolError.
     */
    static AniDBApi::LookupResult parseFileReply(const QByteArray &body);

private:
    void startRequest(const QString &ed2k, qint64 size, const AniDBApi::LookupCallback &done);

    ApplicationSettings::ClientSettings m_client;
    QString m_endpoint;
    qint64 m_timeoutMs;
    RequestThrottle *m_throttle;
    QNetworkAccessManager *m_network;
};

#endif // ANIDBHTTPCLIENT_H
