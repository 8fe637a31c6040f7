#include "applicationsettings.h"
#include "logger.h"
#include <QFileInfo>
#include <QSettings>
#include <QVariant>

namespace {

qint64 readMs(QSettings& ini, const QString& key, qint64 current)
{
    bool ok = false;
    qint64 value = ini.value(key, current).toLongLong(&ok);
    if (!ok) {
        LOG_WARN(QString("[Settings] Ignoring non-numeric value for %1").arg(key));
        return current;
    }
    return value;
}

}

bool ApplicationSettings::load(const QString& iniPath)
{
    if (!QFileInfo::exists(iniPath)) {
        LOG(QString("[Settings] %1 not found, using defaults").arg(iniPath));
        return true;
    }

    QSettings ini(iniPath, QSettings::IniFormat);
    if (ini.status() != QSettings::NoError) {
        LOG_ERROR(QString("[Settings] Cannot parse %1").arg(iniPath));
        return false;
    }

    ini.beginGroup("auth");
    m_auth.username = ini.value("username", m_auth.username).toString();
    m_auth.password = ini.value("password", m_auth.password).toString();
    ini.endGroup();

    ini.beginGroup("client");
    m_client.clientName = ini.value("name", m_client.clientName).toString();
    m_client.clientVersion = ini.value("version", m_client.clientVersion).toInt();
    m_client.protocolVersion = ini.value("protocolVersion", m_client.protocolVersion).toInt();
    m_client.encoding = ini.value("encoding", m_client.encoding).toString();
    ini.endGroup();

    ini.beginGroup("server");
    m_server.host = ini.value("host", m_server.host).toString();
    m_server.port = static_cast<quint16>(ini.value("port", m_server.port).toUInt());
    m_server.localPort = static_cast<quint16>(ini.value("localPort", m_server.localPort).toUInt());
    m_server.httpEndpoint = ini.value("httpEndpoint", m_server.httpEndpoint).toString();
    ini.endGroup();

    ini.beginGroup("throttle");
    m_throttle.minSpacingMs = readMs(ini, "minSpacingMs", m_throttle.minSpacingMs);
    m_throttle.fileSpacingMs = readMs(ini, "fileSpacingMs", m_throttle.fileSpacingMs);
    m_throttle.idleResetMs = readMs(ini, "idleResetMs", m_throttle.idleResetMs);
    m_throttle.bulkWindowMs = readMs(ini, "bulkWindowMs", m_throttle.bulkWindowMs);
    m_throttle.cooldownMs = readMs(ini, "cooldownMs", m_throttle.cooldownMs);
    ini.endGroup();

    ini.beginGroup("timeouts");
    m_timeouts.commandMs = readMs(ini, "commandMs", m_timeouts.commandMs);
    m_timeouts.sessionMs = readMs(ini, "sessionMs", m_timeouts.sessionMs);
    m_timeouts.banMs = readMs(ini, "banMs", m_timeouts.banMs);
    ini.endGroup();

    LOG(QString("[Settings] Loaded %1 (user: %2)").arg(iniPath,
        m_auth.username.isEmpty() ? QString("<none>") : m_auth.username));
    return true;
}

bool ApplicationSettings::save(const QString& iniPath) const
{
    QSettings ini(iniPath, QSettings::IniFormat);

    ini.beginGroup("auth");
    ini.setValue("username", m_auth.username);
    ini.setValue("password", m_auth.password);
    ini.endGroup();

    ini.beginGroup("client");
    ini.setValue("name", m_client.clientName);
    ini.setValue("version", m_client.clientVersion);
    ini.setValue("protocolVersion", m_client.protocolVersion);
    ini.setValue("encoding", m_client.encoding);
    ini.endGroup();

    ini.beginGroup("server");
    ini.setValue("host", m_server.host);
    ini.setValue("port", m_server.port);
    ini.setValue("localPort", m_server.localPort);
    ini.setValue("httpEndpoint", m_server.httpEndpoint);
    ini.endGroup();

    ini.beginGroup("throttle");
    ini.setValue("minSpacingMs", m_throttle.minSpacingMs);
    ini.setValue("fileSpacingMs", m_throttle.fileSpacingMs);
    ini.setValue("idleResetMs", m_throttle.idleResetMs);
    ini.setValue("bulkWindowMs", m_throttle.bulkWindowMs);
    ini.setValue("cooldownMs", m_throttle.cooldownMs);
    ini.endGroup();

    ini.beginGroup("timeouts");
    ini.setValue("commandMs", m_timeouts.commandMs);
    ini.setValue("sessionMs", m_timeouts.sessionMs);
    ini.setValue("banMs", m_timeouts.banMs);
    ini.endGroup();

    ini.sync();
    if (ini.status() != QSettings::NoError) {
        LOG_ERROR(QString("[Settings] Failed to write %1").arg(iniPath));
        return false;
    }
    return true;
}

void ApplicationSettings::applyEnvironment()
{
    QString user = qEnvironmentVariable("SHIRABE_ANIDB_USER");
    QString pass = qEnvironmentVariable("SHIRABE_ANIDB_PASS");
    if (!user.isEmpty()) {
        m_auth.username = user;
    }
    if (!pass.isEmpty()) {
        m_auth.password = pass;
    }
}

bool ApplicationSettings::validate(QString* error) const
{
    QString problem;
    if (m_client.clientName.isEmpty()) {
        problem = "client name is empty";
    }
    else if (m_client.clientVersion <= 0) {
        problem = "client version must be positive";
    }
    else if (m_server.host.isEmpty() || m_server.port == 0) {
        problem = "server host and port are required";
    }
    else if (m_throttle.minSpacingMs < 0 || m_throttle.fileSpacingMs < 0 ||
             m_throttle.idleResetMs < 0 || m_throttle.bulkWindowMs <= 0 ||
             m_throttle.cooldownMs < 0) {
        problem = "throttle intervals must not be negative and the bulk window must be positive";
    }
    else if (m_timeouts.commandMs <= 0 || m_timeouts.sessionMs <= 0 || m_timeouts.banMs < 0) {
        problem = "timeouts must be positive";
    }

    if (problem.isEmpty()) {
        return true;
    }
    if (error) {
        *error = problem;
    }
    return false;
}

void ApplicationSettings::setUsername(const QString& username)
{
    if (!username.isEmpty()) {
        m_auth.username = username;
    }
}

void ApplicationSettings::setPassword(const QString& password)
{
    if (!password.isEmpty()) {
        m_auth.password = password;
    }
}
