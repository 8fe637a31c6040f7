#include <QtTest/QtTest>
#include <QSignalSpy>
#include "../shirabe/src/logger.h"

class TestLogger : public QObject
{
    Q_OBJECT

private slots:
    void cleanup()
    {
        Logger::setMinimumLevel(Logger::Debug);
    }

    void testLoggerSingleton()
    {
        Logger* instance1 = Logger::instance();
        Logger* instance2 = Logger::instance();
        QCOMPARE(instance1, instance2);
        QVERIFY(instance1 != nullptr);
    }

    void testLoggerMacro()
    {
        QSignalSpy spy(Logger::instance(), &Logger::logMessage);

        LOG("[AniDB Send] Command: PING");

        QCOMPARE(spy.count(), 1);
        QString loggedMessage = spy.takeFirst().at(0).toString();
        QVERIFY(loggedMessage.contains("test_logger.cpp"));
        QVERIFY(loggedMessage.contains("[AniDB Send] Command: PING"));
    }

    void testLoggerWithFileAndLine()
    {
        QSignalSpy spy(Logger::instance(), &Logger::logMessage);

        Logger::log("with context", "/some/dir/anidbapi.cpp", 42);

        QCOMPARE(spy.count(), 1);
        QString loggedMessage = spy.takeFirst().at(0).toString();
        // Only the base name of the source file is kept
        QVERIFY(loggedMessage.contains("[anidbapi.cpp:42]"));
        QVERIFY(!loggedMessage.contains("/some/dir"));
    }

    void testLoggerWithoutFileAndLine()
    {
        QSignalSpy spy(Logger::instance(), &Logger::logMessage);

        Logger::log("no context", "", 0);

        QCOMPARE(spy.count(), 1);
        QString loggedMessage = spy.takeFirst().at(0).toString();
        // [HH:mm:ss.zzz] message
        QVERIFY(QRegularExpression("^\\[\\d{2}:\\d{2}:\\d{2}\\.\\d{3}\\] no context$").match(loggedMessage).hasMatch());
    }

    void testMinimumLevelFilters()
    {
        QSignalSpy spy(Logger::instance(), &Logger::logMessage);
        Logger::setMinimumLevel(Logger::Warning);
        QCOMPARE(Logger::minimumLevel(), Logger::Warning);

        LOG_DEBUG("dropped");
        LOG("dropped too");
        LOG_WARN("kept");
        LOG_ERROR("kept too");

        QCOMPARE(spy.count(), 2);
        QVERIFY(spy.at(0).at(0).toString().contains("kept"));
    }
};

QTEST_MAIN(TestLogger)
#include "test_logger.moc"
