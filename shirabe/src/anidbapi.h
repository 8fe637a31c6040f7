#ifndef ANIDBAPI_H
#define ANIDBAPI_H

#include <QObject>
#include <QString>
#include <QList>
#include <functional>
#include "anidbcommand.h"
#include "anidberror.h"
#include "anidbfileinfo.h"
#include "anidbresponse.h"
#include "applicationsettings.h"
#include "mask.h"
#include "replywaiter.h"
#include "sessioninfo.h"

class AniDBClock;
class AniDBTransport;
class RequestThrottle;

/**
 * @brief AniDB UDP API client
 *
 * Owns the session with the API server: frames commands, correlates replies
 * by tag, tracks login, session expiry and bans, and decodes FILE replies.
 *
 * One instance per process. The transport, throttle and clock are injected
 * and must outlive the client; the throttle may be shared with other clients
 * (e.g. the HTTP fallback) so that all requests share one rate limit.
 *
 * States: LoggedOut -> LoggedIn on AUTH 200/201, back on LOGOUT, 501/506 or
 * 555. A 555 also bans the client for banMs; while banned every command fails
 * immediately with Banned.
 *
 * Every operation completes exactly once through its callback, on the event
 * loop thread.
 */
class AniDBApi : public QObject
{
	Q_OBJECT
public:
	typedef std::function<void(const AniDBResponse &reply, const AniDBError &error)> CommandCallback;
	typedef std::function<void(const QString &sessionKey, const AniDBError &error)> LoginCallback;
	typedef std::function<void(const AniDBError &error)> LogoutCallback;

	struct LookupResult
	{
		bool found;
		AniDBFileInfo info;
		AniDBError error;
		LookupResult() : found(false) {}
	};
	typedef std::function<void(const LookupResult &result)> LookupCallback;

	/* === Reply codes */
	enum ReplyCode
	{
		LOGIN_ACCEPTED = 200,
		LOGIN_ACCEPTED_NEW_VER = 201,
		LOGGED_OUT = 203,
		FILE = 220,
		MYLIST = 221,
		NO_SUCH_FILE = 320,
		NO_SUCH_ANIME = 330,
		LOGIN_FAILED = 500,
		LOGIN_FIRST = 501,
		ACCESS_DENIED = 502,
		CLIENT_VERSION_OUTDATED = 503,
		CLIENT_BANNED = 504,
		ILLEGAL_INPUT_OR_ACCESS_DENIED = 505,
		INVALID_SESSION = 506,
		BANNED = 555,
		UNKNOWN_COMMAND = 598,
		INTERNAL_SERVER_ERROR = 600,
		OUT_OF_SERVICE = 601,
		SERVER_BUSY = 602
	};
	/* Reply codes === */

	AniDBApi(const ApplicationSettings &settings,
			 AniDBTransport *transport,
			 RequestThrottle *throttle,
			 AniDBClock *clock,
			 QObject *parent = nullptr);
	~AniDBApi() override;

	/**
	 * @brief Open the transport; commands are rejected until this succeeds
	 */
	bool init(QString *error = nullptr);

	/**
	 * @brief Reject every pending command with ShutDown, drop the session and close the transport
	 */
	void shutdown();

	/**
	 * @brief Send a raw command through the throttle
	 *
	 * Replies 555 and 501/506 complete with Banned and SessionExpired. Any
	 * other non-2xx reply completes with ProtocolError and the reply itself,
	 * so callers can still look at the code.
	 */
	void sendCommand(const AniDBCommand &command, CommandCallback done);

	/**
	 * @brief Make sure a session exists
	 *
	 * Returns the cached key without a round trip while the session is
	 * usable. Concurrent calls share one AUTH.
	 */
	void login(LoginCallback done);

	/**
	 * @brief End the session; the local session is dropped whatever the reply
	 */
	void logout(LogoutCallback done);

	/**
	 * @brief FILE lookup by ed2k hash and size
	 *
	 * Logs in first when needed. A 320 completes with found == false and no
	 * error. An expired session is re-established and the lookup retried
	 * exactly once.
	 */
	void lookupFile(const QString &ed2k, qint64 size, LookupCallback done);

	bool isInitialized() const { return initialized; }
	bool isLoggedIn() const;
	// bannedChanged(false) fires when the cooldown lapses
	bool isBanned() const;
	qint64 bannedUntilMs() const { return bannedUntil; }
	int pendingCommands() const { return waiter.pendingCount(); }
	// Tag for the next command; numbering continues upward from it
	void setNextTag(qint64 tag) { nextTag = tag; }

	const Mask &fileMask() const { return fmask; }
	const Mask &animeMask() const { return amask; }
	void setMasks(const Mask &fileMask, const Mask &animeMask);

	// Maps a reply code to its error; None for 2xx
	static AniDBError errorForReply(const AniDBResponse &reply);

public slots:
	void handleDatagram(const QByteArray &datagram);

signals:
	void sessionStateChanged(bool loggedIn);
	void bannedChanged(bool banned);
	// A reply arrived for a tag nothing waits on
	void replyDropped(const QString &tag, int code);

private:
	void dispatchCommand(const AniDBCommand &command, const CommandCallback &done);
	void finishLogin(const QString &sessionKey, const AniDBError &error);
	void lookupAttempt(const QString &ed2k, qint64 size, bool retried, const LookupCallback &done);
	void enterBan(const QString &reason);
	void liftBan();
	void invalidateSession(const QString &reason);

	ApplicationSettings::AuthSettings auth;
	ApplicationSettings::ClientSettings client;
	ApplicationSettings::TimeoutSettings timeouts;

	AniDBTransport *transport;
	RequestThrottle *throttle;
	AniDBClock *clock;

	ReplyWaiter waiter;
	SessionInfo session;
	Mask fmask;
	Mask amask;

	qint64 nextTag;
	bool initialized;
	qint64 bannedUntil;
	int banTask;
	bool loginInFlight;
	QList<LoginCallback> loginWaiters;
};

#endif // ANIDBAPI_H
