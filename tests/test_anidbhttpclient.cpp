#include <QtTest/QtTest>
#include <QUrlQuery>
#include <zlib.h>
#include "../shirabe/src/anidbhttpclient.h"
#include "../shirabe/src/requestthrottle.h"
#include "testclock.h"

namespace {

const char *kFileXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<file>\n"
    "  <fid>312498</fid>\n"
    "  <aid>4688</aid>\n"
    "  <eid>69260</eid>\n"
    "  <gid>7172</gid>\n"
    "  <size>733419264</size>\n"
    "  <ed2k>0123456789abcdef0123456789abcdef</ed2k>\n"
    "  <anime>\n"
    "    <anime_title_romaji>Shingeki no Kyojin</anime_title_romaji>\n"
    "    <anime_title_english>Attack on Titan</anime_title_english>\n"
    "  </anime>\n"
    "  <episode>\n"
    "    <episode_number>01</episode_number>\n"
    "    <episode_title_english>To You, in 2000 Years</episode_title_english>\n"
    "  </episode>\n"
    "  <group><group_name>HorribleSubs</group_name></group>\n"
    "</file>\n";

QByteArray gzip(const QByteArray &data)
{
    z_stream stream;
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        return QByteArray();
    QByteArray out(static_cast<int>(deflateBound(&stream, static_cast<uLong>(data.size()))), Qt::Uninitialized);
    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.constData()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef *>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());
    int ret = deflate(&stream, Z_FINISH);
    out.resize(static_cast<int>(stream.total_out));
    deflateEnd(&stream);
    return ret == Z_STREAM_END ? out : QByteArray();
}

}

class TestAniDBHttpClient : public QObject
{
    Q_OBJECT

private slots:
    void testRequestUrl()
    {
        ManualClock clock;
        ApplicationSettings settings;
        RequestThrottle throttle(&clock, settings.throttle());
        AniDBHttpClient client(settings, &throttle);

        QUrl url = client.fileRequestUrl("0123456789ABCDEF0123456789ABCDEF", 733419264);
        QCOMPARE(url.host(), QString("api.anidb.net"));
        QCOMPARE(url.port(), 9001);
        QCOMPARE(url.path(), QString("/httpapi"));
        QUrlQuery query(url);
        QCOMPARE(query.queryItemValue("request"), QString("file"));
        QCOMPARE(query.queryItemValue("client"), QString("shirabe"));
        QCOMPARE(query.queryItemValue("clientver"), QString("1"));
        QCOMPARE(query.queryItemValue("ed2k"), QString("0123456789abcdef0123456789abcdef"));
        QCOMPARE(query.queryItemValue("size"), QString("733419264"));
    }

    void testParseFound()
    {
        AniDBApi::LookupResult result = AniDBHttpClient::parseFileReply(kFileXml);
        QVERIFY(result.found);
        QVERIFY(!result.error);
        QCOMPARE(result.info.fileId(), 312498);
        QCOMPARE(result.info.animeId(), 4688);
        QCOMPARE(result.info.groupId(), 7172);
        QCOMPARE(result.info.size(), qint64(733419264));
        QCOMPARE(result.info.anime().nameromaji, QString("Shingeki no Kyojin"));
        QCOMPARE(result.info.anime().nameenglish, QString("Attack on Titan"));
        QCOMPARE(result.info.episode().epno, QString("01"));
        QCOMPARE(result.info.episode().epname, QString("To You, in 2000 Years"));
        QCOMPARE(result.info.group().groupname, QString("HorribleSubs"));
    }

    void testParseGzipped()
    {
        AniDBApi::LookupResult result = AniDBHttpClient::parseFileReply(gzip(kFileXml));
        QVERIFY(result.found);
        QCOMPARE(result.info.fileId(), 312498);
    }

    void testParseNoSuchFile()
    {
        AniDBApi::LookupResult result = AniDBHttpClient::parseFileReply("<error>No such file</error>");
        QVERIFY(!result.found);
        QVERIFY(!result.error);
    }

    void testParseOtherError()
    {
        AniDBApi::LookupResult result = AniDBHttpClient::parseFileReply("<error>Client values missing or invalid</error>");
        QVERIFY(!result.found);
        QCOMPARE(result.error.kind(), AniDBError::ProtocolError);
        QVERIFY(result.error.message().contains("Client values missing"));
    }

    void testParseMalformed()
    {
        AniDBApi::LookupResult result = AniDBHttpClient::parseFileReply("<file><fid>1");
        QVERIFY(!result.found);
        QCOMPARE(result.error.kind(), AniDBError::ProtocolFraming);
    }

    void testParseWithoutFileId()
    {
        AniDBApi::LookupResult result = AniDBHttpClient::parseFileReply("<file><aid>4</aid></file>");
        QVERIFY(!result.found);
        QCOMPARE(result.error.kind(), AniDBError::ProtocolError);
    }
};

QTEST_MAIN(TestAniDBHttpClient)
#include "test_anidbhttpclient.moc"
