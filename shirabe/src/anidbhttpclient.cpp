#include "anidbhttpclient.h"
#include "anidbresponse.h"
#include "logger.h"
#include "requestthrottle.h"
#include <QHash>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QUrlQuery>
#include <QXmlStreamReader>

AniDBHttpClient::AniDBHttpClient(const ApplicationSettings &settings,
                                 RequestThrottle *throttle,
                                 QObject *parent)
    : QObject(parent)
    , m_client(settings.client())
    , m_endpoint(settings.server().httpEndpoint)
    , m_timeoutMs(settings.timeouts().commandMs)
    , m_throttle(throttle)
    , m_network(new QNetworkAccessManager(this))
{
}

QUrl AniDBHttpClient::fileRequestUrl(const QString &ed2k, qint64 size) const
{
    QUrl url(m_endpoint);
    QUrlQuery query;
    query.addQueryItem("request", "file");
    query.addQueryItem("client", m_client.clientName);
    query.addQueryItem("clientver", QString::number(m_client.clientVersion));
    query.addQueryItem("protover", "1");
    query.addQueryItem("ed2k", ed2k.toLower());
    query.addQueryItem("size", QString::number(size));
    url.setQuery(query);
    return url;
}

void AniDBHttpClient::lookupFile(const QString &ed2k, qint64 size, AniDBApi::LookupCallback done)
{
    QPointer<AniDBHttpClient> self(this);
    m_throttle->awaitTurn("HTTP FILE", [self, ed2k, size, done](bool granted)
    {
        if (self.isNull() || !granted) {
            AniDBApi::LookupResult result;
            result.error = AniDBError(AniDBError::ShutDown, "HTTP lookup cancelled");
            done(result);
            return;
        }
        self->startRequest(ed2k, size, done);
    });
}

void AniDBHttpClient::startRequest(const QString &ed2k, qint64 size, const AniDBApi::LookupCallback &done)
{
    QNetworkRequest request(fileRequestUrl(ed2k, size));
    request.setHeader(QNetworkRequest::UserAgentHeader,
                      QString("%1/%2").arg(m_client.clientName).arg(m_client.clientVersion));
    request.setTransferTimeout(static_cast<int>(m_timeoutMs));

    LOG(QString("[AniDB HTTP] Looking up %1 size %2").arg(ed2k).arg(size));
    QNetworkReply *reply = m_network->get(request);
    connect(reply, &QNetworkReply::finished, this, [reply, done]()
    {
        reply->deleteLater();
        AniDBApi::LookupResult result;
        if (reply->error() == QNetworkReply::OperationCanceledError ||
            reply->error() == QNetworkReply::TimeoutError) {
            result.error = AniDBError(AniDBError::Timeout, "AniDB HTTP request timeout");
            LOG_WARN("[AniDB HTTP] " + result.error.message());
            done(result);
            return;
        }
        if (reply->error() != QNetworkReply::NoError) {
            result.error = AniDBError(AniDBError::SocketError, reply->errorString());
            LOG_WARN("[AniDB HTTP] Request failed: " + reply->errorString());
            done(result);
            return;
        }
        done(parseFileReply(reply->readAll()));
    });
}

AniDBApi::LookupResult AniDBHttpClient::parseFileReply(const QByteArray &body)
{
    AniDBApi::LookupResult result;

    QByteArray data = body;
    if (AniDBResponse::isGzip(body)) {
        bool ok = false;
        data = AniDBResponse::inflateGzip(body, &ok);
        if (!ok) {
            result.error = AniDBError(AniDBError::ProtocolFraming, "corrupt gzip body");
            return result;
        }
    }

    // First occurrence of each leaf element wins
    QHash<QString, QString> values;
    QString errorText;
    bool hasError = false;
    QXmlStreamReader xml(data);
    QString text;
    bool leaf = false;
    while (!xml.atEnd() && !xml.hasError()) {
        QXmlStreamReader::TokenType token = xml.readNext();
        if (token == QXmlStreamReader::StartElement) {
            text.clear();
            leaf = true;
        } else if (token == QXmlStreamReader::Characters) {
            text += xml.text();
        } else if (token == QXmlStreamReader::EndElement) {
            const QString name = xml.name().toString();
            if (name == QString("error")) {
                hasError = true;
                errorText = text.trimmed();
            } else if (leaf && !values.contains(name) && !text.trimmed().isEmpty()) {
                values.insert(name, text.trimmed());
            }
            leaf = false;
            text.clear();
        }
    }

    if (xml.hasError() && values.isEmpty() && !hasError) {
        result.error = AniDBError(AniDBError::ProtocolFraming, "malformed XML: " + xml.errorString());
        return result;
    }

    if (hasError) {
        if (errorText.contains("No such file", Qt::CaseInsensitive)) {
            LOG("[AniDB HTTP] File not found in AniDB");
            return result;
        }
        result.error = AniDBError(AniDBError::ProtocolError, "AniDB HTTP error: " +
            (errorText.isEmpty() ? QString("Unknown error") : errorText));
        return result;
    }

    AniDBFileInfo::FileData file;
    file.fid = values.value("fid");
    file.aid = values.value("aid");
    file.eid = values.value("eid");
    file.gid = values.value("gid");
    file.size = values.value("size");
    file.ed2k = values.value("ed2k");

    AniDBFileInfo::AnimeData anime;
    anime.nameromaji = values.value("anime_title_romaji");
    anime.nameenglish = values.value("anime_title_english");

    AniDBFileInfo::EpisodeData episode;
    episode.epno = values.value("episode_number");
    episode.epnameromaji = values.value("episode_title_romaji");
    episode.epname = values.value("episode_title_english");
    if (episode.epname.isEmpty())
        episode.epname = episode.epnameromaji;

    AniDBFileInfo::GroupData group;
    group.groupname = values.value("group_name");

    result.info = AniDBFileInfo::fromParts(file, anime, episode, group, QString::fromUtf8(data));
    result.found = result.info.isValid();
    if (!result.found)
        result.error = AniDBError(AniDBError::ProtocolError, "HTTP reply without file id");
    return result;
}
