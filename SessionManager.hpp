#pragma once

#include <memory>
#include <asio.hpp>
#include "ClientConfig.hpp"
#include "HttpMessage.hpp"
#include "Logger.hpp"
#include "OnceBroadcast.hpp"





namespace ProtectClientPp
{





// fwd:
class RequestGateway;





enum class SessionState
{
	LoggedOut,
	AcquiringToken,
	LoggingIn,
	LoggedIn,
};





/** The credentials of a single login session with the NVR. */
struct Session
{
	/** The anti-forgery token, sent as the X-CSRF-Token header. Empty if not acquired yet. */
	std::string csrfToken;

	/** The session cookie(s), sent as the Cookie header. Empty if not logged in. */
	std::string cookie;

	bool loggedIn = false;

	/** The time of the last successful login. */
	Clock::time_point loginAge;

	/** Whether the logged in user has the Administrator role (as determined by the last bootstrap). */
	bool isAdmin = false;


	/** Returns the headers to attach to API requests made within this session. */
	HttpHeaders headers() const;
};





/** Owns the Session and performs the login dance with the NVR.
Concurrent login requests are coalesced into a single login attempt.
All methods must be called from the io_context's thread; all callbacks are called from it as well. */
class SessionManager:
	public std::enable_shared_from_this<SessionManager>
{
public:

	using Callback = std::function<void(const std::error_code &)>;


	/** Creates a new instance, wrapped in a shared_ptr (required for lifetime management of the async handlers).
	If aNow is empty, the steady clock is used. */
	static std::shared_ptr<SessionManager> create(
		asio::io_context & aIoContext,
		std::shared_ptr<RequestGateway> aGateway,
		const ClientConfig & aConfig,
		std::shared_ptr<Logger> aLogger,
		NowFunction aNow = nullptr
	);

	/** Makes sure that there's a valid login session, logging in if needed.
	Calls the callback asynchronously once done; an empty error code means the session is valid.
	If a login attempt is already in progress, no new attempt is made, the callback receives the outcome of the
	attempt in progress. */
	void ensureLoggedIn(Callback aOnFinish);

	/** Resets all the session state and notifies the session-cleared listeners (which tear down the realtime
	connection and drop the cached bootstrap).
	Used as the recovery action for all authentication-related failures. */
	void clearSession();

	/** Adds a listener that is called each time the session is cleared. */
	void addOnSessionCleared(std::function<void()> aListener) { mOnSessionCleared.push_back(std::move(aListener)); }

	/** Records the Administrator role status, as determined from the bootstrap. */
	void setAdmin(bool aIsAdmin) { mSession.isAdmin = aIsAdmin; }

	const Session & session() const { return mSession; }
	SessionState state() const { return mState; }
	bool isLoginPending() const { return mPendingLogin.isPending(); }
	const std::string & username() const { return mUsername; }

	/** Converts the Set-Cookie header values into a single Cookie header value.
	Only the "name=value" part of each cookie is kept, the attributes are dropped. */
	static std::string cookieFromSetCookie(const std::vector<std::string> & aSetCookies);


protected:

	asio::io_context & mIoContext;
	std::shared_ptr<RequestGateway> mGateway;
	std::shared_ptr<Logger> mLogger;
	NowFunction mNow;

	std::string mNvrAddress;
	std::string mUsername;
	std::string mPassword;
	Clock::duration mLoginRefreshInterval;

	Session mSession;
	SessionState mState;

	/** The login attempt in progress, shared by all callers of ensureLoggedIn(). */
	OnceBroadcast<std::error_code> mPendingLogin;

	/** The time at which the current login attempt started; stored as the loginAge on success. */
	Clock::time_point mAttemptStartedAt;

	std::vector<std::function<void()>> mOnSessionCleared;


	SessionManager(
		asio::io_context & aIoContext,
		std::shared_ptr<RequestGateway> aGateway,
		const ClientConfig & aConfig,
		std::shared_ptr<Logger> aLogger,
		NowFunction aNow
	);

	/** Performs a single login attempt; the result is delivered through finishLogin(). */
	void startLogin();

	/** Requests a CSRF token from the NVR's base address, then continues with submitCredentials(). */
	void acquireToken();

	/** Posts the credentials to the login endpoint. */
	void submitCredentials();

	/** Processes the login response, stores the session credentials. */
	void onLoginResp(const std::error_code & aError, const HttpResponse & aResponse);

	/** Ends the current login attempt, delivering the outcome to all the waiters. */
	void finishLogin(const std::error_code & aError);

	/** Clears the session and ends the current login attempt with the specified error. */
	void failLogin(const std::error_code & aError);
};

}  // namespace ProtectClientPp
