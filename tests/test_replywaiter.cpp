#include <QtTest/QtTest>
#include "../shirabe/src/replywaiter.h"
#include "testclock.h"

class TestReplyWaiter : public QObject
{
    Q_OBJECT

private slots:
    void testSettleDeliversReply();
    void testTimeoutFailsEntry();
    void testDuplicateTagRejected();
    void testUnknownTag();
    void testFailAll();
};

void TestReplyWaiter::testSettleDeliversReply()
{
    ManualClock clock;
    ReplyWaiter waiter(&clock);
    int calls = 0;
    int code = 0;
    AniDBError error(AniDBError::IoError, "unset");
    QVERIFY(waiter.add("1", "AUTH", 30000, [&](const AniDBResponse &reply, const AniDBError &e) {
        calls++;
        code = reply.code();
        error = e;
    }));
    QVERIFY(waiter.isPending("1"));
    QCOMPARE(waiter.description("1"), QString("AUTH"));

    QVERIFY(waiter.settle("1", AniDBResponse::parse("1 200 key LOGIN ACCEPTED")));
    QCOMPARE(calls, 1);
    QCOMPARE(code, 200);
    QVERIFY(!error);
    QCOMPARE(waiter.pendingCount(), 0);

    // The timeout was cancelled with the entry
    clock.advance(60000);
    QCOMPARE(calls, 1);
    QCOMPARE(clock.pendingTasks(), 0);
}

void TestReplyWaiter::testTimeoutFailsEntry()
{
    ManualClock clock;
    ReplyWaiter waiter(&clock);
    AniDBError error;
    int calls = 0;
    waiter.add("7", "FILE", 30000, [&](const AniDBResponse &, const AniDBError &e) {
        calls++;
        error = e;
    });

    clock.advance(29999);
    QCOMPARE(calls, 0);
    clock.advance(1);
    QCOMPARE(calls, 1);
    QCOMPARE(error.kind(), AniDBError::Timeout);
    QVERIFY(!waiter.isPending("7"));

    // A late reply finds nothing to settle
    QVERIFY(!waiter.settle("7", AniDBResponse::parse("7 220 FILE\n1")));
    QCOMPARE(calls, 1);
}

void TestReplyWaiter::testDuplicateTagRejected()
{
    ManualClock clock;
    ReplyWaiter waiter(&clock);
    int first = 0;
    int second = 0;
    QVERIFY(waiter.add("3", "FILE", 1000, [&](const AniDBResponse &, const AniDBError &) { first++; }));
    QVERIFY(!waiter.add("3", "FILE", 1000, [&](const AniDBResponse &, const AniDBError &) { second++; }));

    waiter.settle("3", AniDBResponse::parse("3 320 NO SUCH FILE"));
    QCOMPARE(first, 1);
    QCOMPARE(second, 0);
}

void TestReplyWaiter::testUnknownTag()
{
    ManualClock clock;
    ReplyWaiter waiter(&clock);
    QVERIFY(!waiter.settle("99", AniDBResponse::parse("99 200 x")));
    QVERIFY(!waiter.fail("99", AniDBError(AniDBError::Banned, "x")));
}

void TestReplyWaiter::testFailAll()
{
    ManualClock clock;
    ReplyWaiter waiter(&clock);
    QList<AniDBError::Kind> kinds;
    auto record = [&](const AniDBResponse &, const AniDBError &e) { kinds.append(e.kind()); };
    waiter.add("1", "AUTH", 1000, record);
    waiter.add("2", "FILE", 1000, record);

    waiter.failAll(AniDBError(AniDBError::ShutDown, "client shut down"));
    QCOMPARE(kinds.size(), 2);
    QCOMPARE(kinds.at(0), AniDBError::ShutDown);
    QCOMPARE(kinds.at(1), AniDBError::ShutDown);
    QCOMPARE(waiter.pendingCount(), 0);
    QCOMPARE(clock.pendingTasks(), 0);
}

QTEST_MAIN(TestReplyWaiter)
#include "test_replywaiter.moc"
