#ifndef APPLICATIONSETTINGS_H
#define APPLICATIONSETTINGS_H

#include <QString>

/**
 * @brief All tunables of the identification stack, grouped by concern
 *
 * Defaults match what AniDB expects from a well-behaved client. Values are
 * read from an INI file (QSettings) with one group per struct:
 *
 *   [auth]      username, password
 *   [client]    name, version, protocolVersion, encoding
 *   [server]    host, port, localPort, httpEndpoint
 *   [throttle]  minSpacingMs, fileSpacingMs, idleResetMs, bulkWindowMs, cooldownMs
 *   [timeouts]  commandMs, sessionMs, banMs
 *
 * SHIRABE_ANIDB_USER / SHIRABE_ANIDB_PASS override the stored credentials.
 */
class ApplicationSettings
{
public:
    struct AuthSettings {
        QString username;
        QString password;

        AuthSettings() = default;
        bool isComplete() const { return !username.isEmpty() && !password.isEmpty(); }
    };

    struct ClientSettings {
        QString clientName;
        int clientVersion;
        int protocolVersion;
        QString encoding;

        ClientSettings()
            : clientName("shirabe")
            , clientVersion(1)
            , protocolVersion(3)
            , encoding("UTF8") {}
    };

    struct ServerSettings {
        QString host;
        quint16 port;
        quint16 localPort;      // 0 = ephemeral
        QString httpEndpoint;

        ServerSettings()
            : host("api.anidb.net")
            , port(9000)
            , localPort(0)
            , httpEndpoint("http://api.anidb.net:9001/httpapi") {}
    };

    struct ThrottleSettings {
        qint64 minSpacingMs;    // between any two requests
        qint64 fileSpacingMs;   // between FILE lookups
        qint64 idleResetMs;     // a longer gap closes the bulk window
        qint64 bulkWindowMs;    // continuous activity before a cooldown
        qint64 cooldownMs;

        ThrottleSettings()
            : minSpacingMs(2500)
            , fileSpacingMs(4000)
            , idleResetMs(2 * 60 * 1000)
            , bulkWindowMs(30 * 60 * 1000)
            , cooldownMs(5 * 60 * 1000) {}
    };

    struct TimeoutSettings {
        qint64 commandMs;
        qint64 sessionMs;
        qint64 banMs;

        TimeoutSettings()
            : commandMs(30 * 1000)
            , sessionMs(30 * 60 * 1000)
            , banMs(30 * 60 * 1000) {}
    };

    ApplicationSettings() = default;

    /**
     * @brief Read settings from an INI file; missing keys keep their current value
     * @return false if the file exists but cannot be parsed
     */
    bool load(const QString& iniPath);

    /**
     * @brief Write every group to an INI file (credentials included)
     */
    bool save(const QString& iniPath) const;

    /**
     * @brief Apply SHIRABE_ANIDB_USER / SHIRABE_ANIDB_PASS if set
     */
    void applyEnvironment();

    /**
     * @brief Check value ranges
     * @param error Receives a description of the first invalid value
     */
    bool validate(QString* error = nullptr) const;

    const AuthSettings& auth() const { return m_auth; }
    AuthSettings& auth() { return m_auth; }

    const ClientSettings& client() const { return m_client; }
    ClientSettings& client() { return m_client; }

    const ServerSettings& server() const { return m_server; }
    ServerSettings& server() { return m_server; }

    const ThrottleSettings& throttle() const { return m_throttle; }
    ThrottleSettings& throttle() { return m_throttle; }

    const TimeoutSettings& timeouts() const { return m_timeouts; }
    TimeoutSettings& timeouts() { return m_timeouts; }

    QString getUsername() const { return m_auth.username; }
    void setUsername(const QString& username);

    QString getPassword() const { return m_auth.password; }
    void setPassword(const QString& password);

private:
    AuthSettings m_auth;
    ClientSettings m_client;
    ServerSettings m_server;
    ThrottleSettings m_throttle;
    TimeoutSettings m_timeouts;
};

#endif // APPLICATIONSETTINGS_H
