#include "anidbapi.h"
#include "anidbclock.h"
#include "anidbtransport.h"
#include "logger.h"
#include "requestthrottle.h"
#include <QPointer>
#include <utility>

AniDBApi::AniDBApi(const ApplicationSettings &settings,
				   AniDBTransport *transport,
				   RequestThrottle *throttle,
				   AniDBClock *clock,
				   QObject *parent)
	: QObject(parent)
	, auth(settings.auth())
	, client(settings.client())
	, timeouts(settings.timeouts())
	, transport(transport)
	, throttle(throttle)
	, clock(clock)
	, waiter(clock)
	, fmask(Mask::defaultFileMask())
	, amask(Mask::defaultAnimeMask())
	, nextTag(1)
	, initialized(false)
	, bannedUntil(0)
	, banTask(0)
	, loginInFlight(false)
{
	connect(transport, &AniDBTransport::datagramReceived, this, &AniDBApi::handleDatagram);
}

AniDBApi::~AniDBApi()
{
	if(banTask != 0)
		clock->cancel(banTask);
	shutdown();
}

bool AniDBApi::init(QString *error)
{
	if(initialized)
		return true;

	QString reason;
	if(!transport->open(&reason))
	{
		LOG_ERROR("[AniDB Init] Transport failed to open: " + reason);
		if(error)
			*error = reason;
		return false;
	}
	initialized = true;
	LOG(QString("[AniDB Init] Client %1 v%2 ready").arg(client.clientName).arg(client.clientVersion));
	return true;
}

void AniDBApi::shutdown()
{
	if(!initialized && waiter.pendingCount() == 0)
		return;

	initialized = false;
	waiter.failAll(AniDBError(AniDBError::ShutDown, "client shut down"));
	if(session.isValid())
		invalidateSession("shutdown");
	transport->close();
	LOG("[AniDB Init] Client shut down");
}

bool AniDBApi::isLoggedIn() const
{
	return session.isUsable(clock->nowMs());
}

bool AniDBApi::isBanned() const
{
	return bannedUntil != 0 && clock->nowMs() < bannedUntil;
}

void AniDBApi::setMasks(const Mask &fileMask, const Mask &animeMask)
{
	fmask = fileMask;
	amask = animeMask;
}

AniDBError AniDBApi::errorForReply(const AniDBResponse &reply)
{
	const int code = reply.code();
	switch(code)
	{
		case BANNED:
			return AniDBError(AniDBError::Banned, "AniDB banned this client: " + reply.text(), code);
		case LOGIN_FIRST:
		case INVALID_SESSION:
			return AniDBError(AniDBError::SessionExpired, "Session expired", code);
		case LOGIN_FAILED:
			return AniDBError(AniDBError::AuthFailure, "Invalid credentials", code);
		case ACCESS_DENIED:
		case ILLEGAL_INPUT_OR_ACCESS_DENIED:
			return AniDBError(AniDBError::AuthFailure, "Client not registered or access denied", code);
		case CLIENT_VERSION_OUTDATED:
			return AniDBError(AniDBError::AuthFailure, "Client version outdated", code);
		case CLIENT_BANNED:
			return AniDBError(AniDBError::AuthFailure, "Client banned: " + reply.text(), code);
		case INTERNAL_SERVER_ERROR:
			return AniDBError(AniDBError::ProtocolError, "AniDB internal server error", code);
		case OUT_OF_SERVICE:
			return AniDBError(AniDBError::ProtocolError, "AniDB out of service", code);
		case SERVER_BUSY:
			return AniDBError(AniDBError::ProtocolError, "AniDB server busy", code);
		default:
			break;
	}
	if(reply.isSuccess())
		return AniDBError();
	return AniDBError(AniDBError::ProtocolError,
		QString("%1 %2").arg(code).arg(reply.text()).trimmed(), code);
}

void AniDBApi::sendCommand(const AniDBCommand &command, CommandCallback done)
{
	if(!initialized)
	{
		done(AniDBResponse(), AniDBError(AniDBError::SocketError, "client is not initialized"));
		return;
	}
	if(isBanned())
	{
		done(AniDBResponse(), AniDBError(AniDBError::Banned,
			QString("Client is banned from AniDB for another %1 s").arg((bannedUntil - clock->nowMs()) / 1000)));
		return;
	}

	QPointer<AniDBApi> self(this);
	auto granted = [self, command, done](bool ok)
	{
		if(self.isNull())
		{
			done(AniDBResponse(), AniDBError(AniDBError::ShutDown, "client destroyed"));
			return;
		}
		if(!ok)
		{
			done(AniDBResponse(), AniDBError(AniDBError::ShutDown, "request throttle shut down"));
			return;
		}
		self->dispatchCommand(command, done);
	};

	if(command.isFileCommand())
		throttle->awaitFileTurn(command.verb(), granted);
	else
		throttle->awaitTurn(command.verb(), granted);
}

void AniDBApi::dispatchCommand(const AniDBCommand &command, const CommandCallback &done)
{
	// State may have changed while waiting for the turn
	if(!initialized)
	{
		done(AniDBResponse(), AniDBError(AniDBError::ShutDown, "client shut down"));
		return;
	}
	if(isBanned())
	{
		done(AniDBResponse(), AniDBError(AniDBError::Banned, "Client is banned from AniDB"));
		return;
	}

	const QString tag = QString::number(nextTag++);
	LOG("[AniDB Send] Command: " + command.redacted(tag));

	const bool added = waiter.add(tag, command.verb(), timeouts.commandMs,
		[done](const AniDBResponse &reply, const AniDBError &error)
		{
			if(error)
			{
				done(reply, error);
				return;
			}
			done(reply, errorForReply(reply));
		});
	if(!added)
	{
		// The reply could not be routed back; do not put it on the wire
		done(AniDBResponse(), AniDBError(AniDBError::SocketError,
			QString("tag %1 is already pending").arg(tag)));
		return;
	}

	QString sendError;
	if(!transport->sendDatagram(command.toDatagram(tag), &sendError))
	{
		LOG_ERROR(QString("[AniDB Send] Send failed for tag %1: %2").arg(tag, sendError));
		waiter.fail(tag, AniDBError(AniDBError::SocketError, sendError));
	}
}

void AniDBApi::handleDatagram(const QByteArray &datagram)
{
	AniDBResponse reply = AniDBResponse::parse(datagram);
	if(!reply.isValid())
	{
		LOG_WARN("[AniDB Recv] Dropping datagram: " + reply.errorString());
		return;
	}
	if(reply.wasCompressed())
		LOG_DEBUG("[AniDB Recv] Decompressed gzipped reply");
	if(reply.isTruncated())
		LOG(QString("[AniDB Recv] TRUNCATION DETECTED: datagram at MTU limit, tag %1").arg(reply.tag()));

	LOG(QString("[AniDB Recv] Tag: %1 Code: %2 %3").arg(reply.tag()).arg(reply.code()).arg(reply.text().left(80)));

	if(reply.tag().isEmpty() || !waiter.isPending(reply.tag()))
	{
		LOG_WARN(QString("[AniDB Recv] No pending command for tag '%1', reply dropped").arg(reply.tag()));
		emit replyDropped(reply.tag(), reply.code());
		return;
	}

	if(reply.code() == BANNED)
	{
		enterBan(reply.text());
		waiter.fail(reply.tag(), errorForReply(reply));
		return;
	}
	if(reply.code() == LOGIN_FIRST || reply.code() == INVALID_SESSION)
	{
		invalidateSession(QString("reply %1").arg(reply.code()));
		waiter.fail(reply.tag(), errorForReply(reply));
		return;
	}
	waiter.settle(reply.tag(), reply);
}

void AniDBApi::login(LoginCallback done)
{
	if(session.isUsable(clock->nowMs()))
	{
		LOG_DEBUG("[AniDB Auth] Already logged in, session valid");
		done(session.key(), AniDBError());
		return;
	}
	if(isBanned())
	{
		done(QString(), AniDBError(AniDBError::Banned, "Client is banned from AniDB"));
		return;
	}
	if(!auth.isComplete())
	{
		done(QString(), AniDBError(AniDBError::AuthFailure, "No AniDB credentials configured"));
		return;
	}

	loginWaiters.append(std::move(done));
	if(loginInFlight)
		return;
	loginInFlight = true;

	if(session.isValid())
		invalidateSession("expired");

	LOG(QString("[AniDB Auth] Logging in as %1").arg(auth.username));
	AniDBCommand command("AUTH");
	command.add("user", auth.username)
		.add("pass", auth.password)
		.add("protover", client.protocolVersion)
		.add("client", client.clientName)
		.add("clientver", client.clientVersion)
		.add("enc", client.encoding);

	QPointer<AniDBApi> self(this);
	sendCommand(command, [self](const AniDBResponse &reply, const AniDBError &error)
	{
		if(self.isNull())
			return;

		const int code = reply.code();
		if(code == LOGIN_ACCEPTED || code == LOGIN_ACCEPTED_NEW_VER)
		{
			const QString key = reply.text().section(' ', 0, 0, QString::SectionSkipEmpty);
			if(key.isEmpty())
			{
				self->finishLogin(QString(), AniDBError(AniDBError::ProtocolError, "Login reply without session key", code));
				return;
			}
			if(code == LOGIN_ACCEPTED_NEW_VER)
				LOG("[AniDB Auth] Login accepted, a new client version is available");
			self->session.start(key, self->clock->nowMs() + self->timeouts.sessionMs);
			LOG("[AniDB Auth] Login successful, session: " + self->session.maskedKey());
			emit self->sessionStateChanged(true);
			self->finishLogin(key, AniDBError());
			return;
		}

		if(error)
		{
			LOG_ERROR("[AniDB Auth] Login failed: " + error.toString());
			self->finishLogin(QString(), error);
			return;
		}
		self->finishLogin(QString(), AniDBError(AniDBError::ProtocolError,
			QString("Unexpected login reply %1 %2").arg(code).arg(reply.text()), code));
	});
}

void AniDBApi::finishLogin(const QString &sessionKey, const AniDBError &error)
{
	loginInFlight = false;
	QList<LoginCallback> callbacks;
	callbacks.swap(loginWaiters);
	for(const LoginCallback &callback : std::as_const(callbacks))
		callback(sessionKey, error);
}

void AniDBApi::logout(LogoutCallback done)
{
	if(!session.isValid())
	{
		done(AniDBError());
		return;
	}

	AniDBCommand command("LOGOUT");
	command.add("s", session.key());
	// The key is dead from now on whatever the server says
	invalidateSession("logout");

	sendCommand(command, [done](const AniDBResponse &reply, const AniDBError &error)
	{
		if(reply.code() == LOGGED_OUT)
		{
			LOG("[AniDB Auth] Logged out successfully");
			done(AniDBError());
			return;
		}
		if(error)
			LOG_WARN("[AniDB Auth] Logout error: " + error.toString());
		done(error);
	});
}

void AniDBApi::lookupFile(const QString &ed2k, qint64 size, LookupCallback done)
{
	lookupAttempt(ed2k.toLower(), size, false, done);
}

void AniDBApi::lookupAttempt(const QString &ed2k, qint64 size, bool retried, const LookupCallback &done)
{
	QPointer<AniDBApi> self(this);
	login([self, ed2k, size, retried, done](const QString &sessionKey, const AniDBError &loginError)
	{
		if(loginError)
		{
			LookupResult result;
			result.error = loginError;
			done(result);
			return;
		}
		if(self.isNull())
		{
			LookupResult result;
			result.error = AniDBError(AniDBError::ShutDown, "client destroyed");
			done(result);
			return;
		}

		LOG(QString("[AniDB File] Looking up %1 size %2").arg(ed2k).arg(size));
		const Mask fmask = self->fmask;
		const Mask amask = self->amask;
		AniDBCommand command("FILE");
		command.add("s", sessionKey)
			.add("size", size)
			.add("ed2k", ed2k)
			.add("fmask", fmask.toString())
			.add("amask", amask.toString());

		self->sendCommand(command, [self, ed2k, size, retried, done, fmask, amask](const AniDBResponse &reply, const AniDBError &error)
		{
			LookupResult result;
			if(error.kind() == AniDBError::SessionExpired && !retried && !self.isNull())
			{
				LOG("[AniDB File] Session expired, logging in again and retrying once");
				self->lookupAttempt(ed2k, size, true, done);
				return;
			}
			if(reply.code() == FILE)
			{
				result.found = true;
				result.info = AniDBFileInfo::decode(reply.dataLine(), fmask, amask, reply.isTruncated());
				LOG("[AniDB File] " + result.info.toString());
				done(result);
				return;
			}
			if(reply.code() == NO_SUCH_FILE)
			{
				LOG("[AniDB File] File not found in AniDB");
				done(result);
				return;
			}
			result.error = error;
			if(!result.error)
			{
				result.error = AniDBError(AniDBError::ProtocolError,
					QString("AniDB file lookup failed: %1").arg(reply.code()), reply.code());
			}
			LOG_WARN("[AniDB File] Lookup error: " + result.error.toString());
			done(result);
		});
	});
}

void AniDBApi::enterBan(const QString &reason)
{
	bannedUntil = clock->nowMs() + timeouts.banMs;
	LOG_ERROR(QString("[AniDB Ban] Banned by AniDB (%1), no commands for %2 min")
		.arg(reason).arg(timeouts.banMs / 60000));
	invalidateSession("ban");

	if(banTask != 0)
		clock->cancel(banTask);
	QPointer<AniDBApi> self(this);
	banTask = clock->schedule(timeouts.banMs, [self]()
	{
		if(!self.isNull())
			self->liftBan();
	});
	emit bannedChanged(true);
}

void AniDBApi::liftBan()
{
	banTask = 0;
	if(bannedUntil == 0)
		return;
	bannedUntil = 0;
	LOG("[AniDB Ban] Ban cooldown elapsed");
	emit bannedChanged(false);
}

void AniDBApi::invalidateSession(const QString &reason)
{
	const bool wasValid = session.isValid();
	session.invalidate();
	if(wasValid)
	{
		LOG(QString("[AniDB Auth] Session invalidated (%1)").arg(reason));
		emit sessionStateChanged(false);
	}
}
