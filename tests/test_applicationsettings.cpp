#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QFile>
#include "../shirabe/src/applicationsettings.h"

class TestApplicationSettings : public QObject
{
    Q_OBJECT

private slots:
    void init()
    {
        qunsetenv("SHIRABE_ANIDB_USER");
        qunsetenv("SHIRABE_ANIDB_PASS");
    }

    void testDefaults()
    {
        ApplicationSettings settings;
        QCOMPARE(settings.client().clientName, QString("shirabe"));
        QCOMPARE(settings.client().protocolVersion, 3);
        QCOMPARE(settings.client().encoding, QString("UTF8"));
        QCOMPARE(settings.server().host, QString("api.anidb.net"));
        QCOMPARE(settings.server().port, quint16(9000));
        QCOMPARE(settings.throttle().minSpacingMs, qint64(2500));
        QCOMPARE(settings.throttle().fileSpacingMs, qint64(4000));
        QCOMPARE(settings.throttle().idleResetMs, qint64(120000));
        QCOMPARE(settings.throttle().bulkWindowMs, qint64(1800000));
        QCOMPARE(settings.throttle().cooldownMs, qint64(300000));
        QCOMPARE(settings.timeouts().commandMs, qint64(30000));
        QVERIFY(!settings.auth().isComplete());
        QVERIFY(settings.validate());
    }

    void testMissingFileKeepsDefaults()
    {
        QTemporaryDir dir;
        ApplicationSettings settings;
        QVERIFY(settings.load(dir.filePath("absent.ini")));
        QCOMPARE(settings.server().port, quint16(9000));
    }

    void testLoadIni()
    {
        QTemporaryDir dir;
        QString path = dir.filePath("shirabe.ini");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
        file.write("[auth]\nusername=alice\npassword=hunter2\n"
                   "[server]\nhost=localhost\nport=9100\n"
                   "[throttle]\nfileSpacingMs=5000\ncooldownMs=soon\n"
                   "[timeouts]\ncommandMs=10000\n");
        file.close();

        ApplicationSettings settings;
        QVERIFY(settings.load(path));
        QCOMPARE(settings.getUsername(), QString("alice"));
        QCOMPARE(settings.getPassword(), QString("hunter2"));
        QVERIFY(settings.auth().isComplete());
        QCOMPARE(settings.server().host, QString("localhost"));
        QCOMPARE(settings.server().port, quint16(9100));
        QCOMPARE(settings.throttle().fileSpacingMs, qint64(5000));
        // Unparseable values fall back to the default
        QCOMPARE(settings.throttle().cooldownMs, qint64(300000));
        QCOMPARE(settings.timeouts().commandMs, qint64(10000));
        // Untouched keys keep their defaults
        QCOMPARE(settings.throttle().minSpacingMs, qint64(2500));
    }

    void testSaveAndReload()
    {
        QTemporaryDir dir;
        QString path = dir.filePath("saved.ini");
        ApplicationSettings settings;
        settings.setUsername("bob");
        settings.setPassword("secret");
        settings.throttle().idleResetMs = 60000;
        QVERIFY(settings.save(path));

        ApplicationSettings loaded;
        QVERIFY(loaded.load(path));
        QCOMPARE(loaded.getUsername(), QString("bob"));
        QCOMPARE(loaded.throttle().idleResetMs, qint64(60000));
    }

    void testEnvironmentOverridesFile()
    {
        ApplicationSettings settings;
        settings.setUsername("alice");
        qputenv("SHIRABE_ANIDB_USER", "carol");
        qputenv("SHIRABE_ANIDB_PASS", "pw");
        settings.applyEnvironment();
        QCOMPARE(settings.getUsername(), QString("carol"));
        QCOMPARE(settings.getPassword(), QString("pw"));
    }

    void testEmptySettersIgnored()
    {
        ApplicationSettings settings;
        settings.setUsername("alice");
        settings.setUsername("");
        QCOMPARE(settings.getUsername(), QString("alice"));
    }

    void testValidate()
    {
        ApplicationSettings settings;
        settings.server().port = 0;
        QString error;
        QVERIFY(!settings.validate(&error));
        QVERIFY(error.contains("port"));

        ApplicationSettings negative;
        negative.throttle().minSpacingMs = -1;
        QVERIFY(!negative.validate(&error));
        QVERIFY(error.contains("throttle"));

        ApplicationSettings timeouts;
        timeouts.timeouts().commandMs = 0;
        QVERIFY(!timeouts.validate());
    }
};

QTEST_MAIN(TestApplicationSettings)
#include "test_applicationsettings.moc"
