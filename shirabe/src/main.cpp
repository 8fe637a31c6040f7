#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QTimer>
#include <functional>
#include "anidbapi.h"
#include "anidbclock.h"
#include "anidbhttpclient.h"
#include "anidbtransport.h"
#include "applicationsettings.h"
#include "identificationservice.h"
#include "logger.h"
#include "requestthrottle.h"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

int runHash(const QStringList &files)
{
    Ed2kHasher hasher;
    int failures = 0;
    for (const QString &path : files) {
        if (hasher.hashFile(path) != Ed2kHasher::Ok) {
            out() << path << ": " << hasher.errorString() << Qt::endl;
            failures++;
            continue;
        }
        out() << hasher.hexDigest() << " " << hasher.size() << " " << hasher.ed2kLink() << Qt::endl;
    }
    return failures == 0 ? 0 : 1;
}

int runIdentify(QCoreApplication &app, const ApplicationSettings &settings, bool useHttp, const QStringList &files)
{
    SystemClock clock;
    RequestThrottle throttle(&clock, settings.throttle());
    UdpTransport transport(settings.server().host, settings.server().port, settings.server().localPort);
    AniDBApi api(settings, &transport, &throttle, &clock);
    AniDBHttpClient http(settings, &throttle);
    IdentificationService service(&api, useHttp ? &http : nullptr);

    int failures = 0;
    int next = 0;
    std::function<void()> identifyNext;
    identifyNext = [&]() {
        if (next >= files.size()) {
            api.logout([&](const AniDBError &) {
                api.shutdown();
                throttle.shutdown();
                app.exit(failures == 0 ? 0 : 1);
            });
            return;
        }
        const QString path = files.at(next++);
        service.identify(path, [&, path](const IdentificationService::Identification &result) {
            if (result.error) {
                out() << path << ": error: " << result.error.toString() << Qt::endl;
                failures++;
            } else if (!result.found) {
                out() << path << ": not found (" << result.fingerprint.hash << ")" << Qt::endl;
            } else {
                out() << path << ": " << result.info.toString() << Qt::endl;
            }
            // Stop early once AniDB refuses us; further files would fail the same way
            if (result.error.kind() == AniDBError::Banned || result.error.kind() == AniDBError::AuthFailure)
                next = files.size();
            QTimer::singleShot(0, &app, identifyNext);
        });
    };

    QTimer::singleShot(0, &app, identifyNext);
    return app.exec();
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("shirabe");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Identify anime video files against AniDB");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "hash | identify");
    parser.addPositionalArgument("files", "Files to process", "<files...>");

    QCommandLineOption configOption(QStringList() << "c" << "config",
        "INI file with [auth], [client], [server], [throttle] and [timeouts] groups.", "file");
    QCommandLineOption httpOption("http", "Fall back to the HTTP API when the UDP lookup fails.");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Log debug messages.");
    parser.addOption(configOption);
    parser.addOption(httpOption);
    parser.addOption(verboseOption);
    parser.process(app);

    Logger::setMinimumLevel(parser.isSet(verboseOption) ? Logger::Debug : Logger::Warning);

    const QStringList args = parser.positionalArguments();
    if (args.size() < 2) {
        parser.showHelp(2);
    }
    const QString command = args.first();
    const QStringList files = args.mid(1);

    if (command == "hash") {
        return runHash(files);
    }
    if (command != "identify") {
        out() << "Unknown command: " << command << Qt::endl;
        parser.showHelp(2);
    }

    ApplicationSettings settings;
    if (parser.isSet(configOption) && !settings.load(parser.value(configOption))) {
        out() << "Cannot read " << parser.value(configOption) << Qt::endl;
        return 2;
    }
    settings.applyEnvironment();

    QString problem;
    if (!settings.validate(&problem)) {
        out() << "Invalid settings: " << problem << Qt::endl;
        return 2;
    }
    if (!settings.auth().isComplete()) {
        out() << "No AniDB credentials; set them in the config file or SHIRABE_ANIDB_USER/SHIRABE_ANIDB_PASS" << Qt::endl;
        return 2;
    }

    LOG("Shirabe starting");
    return runIdentify(app, settings, parser.isSet(httpOption), files);
}
