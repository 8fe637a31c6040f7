#include <QtTest/QtTest>
#include <zlib.h>
#include "../shirabe/src/anidbresponse.h"

class TestAniDBResponse : public QObject
{
    Q_OBJECT

private slots:
    void testStrictGrammar();
    void testStrictWithoutText();
    void testSalvageGrammar();
    void testTaglessGrammar();
    void testUnframedReply();
    void testDataLine();
    void testGzipDatagram();
    void testCorruptGzip();
    void testTruncationFlag();

private:
    static QByteArray gzip(const QByteArray &data);
};

QByteArray TestAniDBResponse::gzip(const QByteArray &data)
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

void TestAniDBResponse::testStrictGrammar()
{
    AniDBResponse reply = AniDBResponse::parse("42 200 abcde LOGIN ACCEPTED");
    QVERIFY(reply.isValid());
    QCOMPARE(reply.grammar(), AniDBResponse::Strict);
    QCOMPARE(reply.tag(), QString("42"));
    QCOMPARE(reply.code(), 200);
    QCOMPARE(reply.text(), QString("abcde LOGIN ACCEPTED"));
    QVERIFY(reply.isSuccess());
    QVERIFY(!reply.wasCompressed());
    QVERIFY(!reply.isTruncated());
}

void TestAniDBResponse::testStrictWithoutText()
{
    AniDBResponse reply = AniDBResponse::parse("7 203\n");
    QCOMPARE(reply.grammar(), AniDBResponse::Strict);
    QCOMPARE(reply.tag(), QString("7"));
    QCOMPARE(reply.code(), 203);
    QVERIFY(reply.text().isEmpty());
}

void TestAniDBResponse::testSalvageGrammar()
{
    // Junk between tag and code: the first three-digit token is the code
    AniDBResponse reply = AniDBResponse::parse("12 x1 4567 320 NO SUCH FILE");
    QVERIFY(reply.isValid());
    QCOMPARE(reply.grammar(), AniDBResponse::Salvage);
    QCOMPARE(reply.tag(), QString("12"));
    QCOMPARE(reply.code(), 320);
    QCOMPARE(reply.text(), QString("NO SUCH FILE"));
    QVERIFY(!reply.isSuccess());
}

void TestAniDBResponse::testTaglessGrammar()
{
    AniDBResponse reply = AniDBResponse::parse("555 BANNED\nLeech");
    QVERIFY(reply.isValid());
    QCOMPARE(reply.grammar(), AniDBResponse::Tagless);
    QVERIFY(reply.tag().isEmpty());
    QCOMPARE(reply.code(), 555);
    QCOMPARE(reply.text(), QString("BANNED"));
    QCOMPARE(reply.dataLine(), QString("Leech"));
}

void TestAniDBResponse::testUnframedReply()
{
    AniDBResponse reply = AniDBResponse::parse("hello world");
    QVERIFY(!reply.isValid());
    QCOMPARE(reply.grammar(), AniDBResponse::Invalid);
    QVERIFY(reply.errorString().contains("hello world"));

    QVERIFY(!AniDBResponse::parse("").isValid());
    QVERIFY(!AniDBResponse::parse("12 abc").isValid());
}

void TestAniDBResponse::testDataLine()
{
    AniDBResponse reply = AniDBResponse::parse("3 220 FILE\r\n312498|4688|69260\r\n");
    QCOMPARE(reply.code(), 220);
    QCOMPARE(reply.text(), QString("FILE"));
    QCOMPARE(reply.dataLine(), QString("312498|4688|69260"));
    QCOMPARE(reply.payloadLines().size(), 1);

    // Without a second line the text stands in
    QCOMPARE(AniDBResponse::parse("4 200 key LOGIN ACCEPTED").dataLine(), QString("key LOGIN ACCEPTED"));
}

void TestAniDBResponse::testGzipDatagram()
{
    QByteArray plain("9 220 FILE\n1|2|3");
    QByteArray packed = gzip(plain);
    QVERIFY(AniDBResponse::isGzip(packed));
    QVERIFY(!AniDBResponse::isGzip(plain));

    AniDBResponse reply = AniDBResponse::parse(packed);
    QVERIFY(reply.isValid());
    QVERIFY(reply.wasCompressed());
    QCOMPARE(reply.tag(), QString("9"));
    QCOMPARE(reply.code(), 220);
    QCOMPARE(reply.dataLine(), QString("1|2|3"));
}

void TestAniDBResponse::testCorruptGzip()
{
    QByteArray packed = gzip("9 220 FILE\n1|2|3");
    packed.chop(packed.size() / 2);

    bool ok = true;
    QVERIFY(AniDBResponse::inflateGzip(packed, &ok).isEmpty());
    QVERIFY(!ok);

    AniDBResponse reply = AniDBResponse::parse(packed);
    QVERIFY(!reply.isValid());
    QVERIFY(reply.wasCompressed());
    QCOMPARE(reply.errorString(), QString("corrupt gzip datagram"));
}

void TestAniDBResponse::testTruncationFlag()
{
    QByteArray line = "5 220 FILE\n" + QByteArray(AniDBResponse::TruncationThreshold, 'x');
    AniDBResponse full = AniDBResponse::parse(line);
    QVERIFY(full.isValid());
    QVERIFY(full.isTruncated());

    QByteArray shortLine = "5 220 FILE\n" + QByteArray(100, 'x');
    QVERIFY(!AniDBResponse::parse(shortLine).isTruncated());
}

QTEST_MAIN(TestAniDBResponse)
#include "test_anidbresponse.moc"
