#include "SessionManager.hpp"

#include <fmt/format.h>
#include "Error.hpp"
#include "RequestGateway.hpp"
#include "Urls.hpp"





namespace ProtectClientPp
{





////////////////////////////////////////////////////////////////////////////////
// Session:

HttpHeaders Session::headers() const
{
	HttpHeaders res;
	if (!csrfToken.empty())
	{
		res.emplace_back("X-CSRF-Token", csrfToken);
	}
	if (!cookie.empty())
	{
		res.emplace_back("Cookie", cookie);
	}
	return res;
}





////////////////////////////////////////////////////////////////////////////////
// SessionManager:

std::shared_ptr<SessionManager> SessionManager::create(
	asio::io_context & aIoContext,
	std::shared_ptr<RequestGateway> aGateway,
	const ClientConfig & aConfig,
	std::shared_ptr<Logger> aLogger,
	NowFunction aNow
)
{
	return std::shared_ptr<SessionManager>(new SessionManager(aIoContext, std::move(aGateway), aConfig, std::move(aLogger), std::move(aNow)));
}





SessionManager::SessionManager(
	asio::io_context & aIoContext,
	std::shared_ptr<RequestGateway> aGateway,
	const ClientConfig & aConfig,
	std::shared_ptr<Logger> aLogger,
	NowFunction aNow
):
	mIoContext(aIoContext),
	mGateway(std::move(aGateway)),
	mLogger(std::move(aLogger)),
	mNow(aNow ? std::move(aNow) : NowFunction(&Clock::now)),
	mNvrAddress(aConfig.address),
	mUsername(aConfig.username),
	mPassword(aConfig.password),
	mLoginRefreshInterval(aConfig.loginRefreshInterval),
	mState(SessionState::LoggedOut)
{
}





void SessionManager::ensureLoggedIn(Callback aOnFinish)
{
	if (!mPendingLogin.wait(std::move(aOnFinish)))
	{
		// Another login attempt is in progress, the callback will receive its outcome
		return;
	}
	startLogin();
}





void SessionManager::clearSession()
{
	mSession = Session();
	mState = SessionState::LoggedOut;
	for (const auto & listener: mOnSessionCleared)
	{
		listener();
	}
}





std::string SessionManager::cookieFromSetCookie(const std::vector<std::string> & aSetCookies)
{
	std::string res;
	for (const auto & setCookie: aSetCookies)
	{
		auto nameValue = setCookie.substr(0, setCookie.find(';'));
		auto first = nameValue.find_first_not_of(' ');
		auto last = nameValue.find_last_not_of(' ');
		if ((first == std::string::npos) || (nameValue.find('=') == std::string::npos))
		{
			continue;
		}
		if (!res.empty())
		{
			res.append("; ");
		}
		res.append(nameValue, first, last - first + 1);
	}
	return res;
}





void SessionManager::startLogin()
{
	mAttemptStartedAt = mNow();

	// Is it time to renew our credentials?
	if (mSession.loggedIn && (mAttemptStartedAt > mSession.loginAge + mLoginRefreshInterval))
	{
		mLogger->debug(fmt::format("{}: Login session expired, logging in again.", mNvrAddress));
		clearSession();
	}

	// Already logged in, report asynchronously so that the callers always see the same calling convention:
	if (mSession.loggedIn)
	{
		asio::post(mIoContext, [self = shared_from_this()]() { self->finishLogin({}); });
		return;
	}

	if (mSession.csrfToken.empty())
	{
		return acquireToken();
	}
	submitCredentials();
}





void SessionManager::acquireToken()
{
	// The NVR has cross-site request forgery protection built into its web UI. Connecting directly to its base
	// address hands out a CSRF token; its presence fingerprints the variant that requires the login dance below.
	mState = SessionState::AcquiringToken;
	mGateway->send(Urls::baseUrl(mNvrAddress), "GET", "", false, false,
		[self = shared_from_this()](const std::error_code & aError, const HttpResponse & aResponse)
		{
			if (aError)
			{
				return self->failLogin(aError);
			}
			self->mGateway->recordOutcome(aResponse.isOk());
			auto csrfToken = aResponse.isOk() ? aResponse.header("X-CSRF-Token") : std::string();
			if (csrfToken.empty())
			{
				self->mLogger->error(fmt::format(
					"{}: Unable to acquire a CSRF token from the controller (HTTP status {}).",
					self->mNvrAddress, aResponse.status
				));
				return self->failLogin(Error::TokenUnavailable);
			}
			self->mSession.csrfToken = csrfToken;
			self->submitCredentials();
		}
	);
}





void SessionManager::submitCredentials()
{
	mState = SessionState::LoggingIn;
	nlohmann::json js =
	{
		{"password", mPassword},
		{"username", mUsername},
	};
	mGateway->send(Urls::authUrl(mNvrAddress), "POST", js.dump(),
		[self = shared_from_this()](const std::error_code & aError, const HttpResponse & aResponse)
		{
			self->onLoginResp(aError, aResponse);
		}
	);
}





void SessionManager::onLoginResp(const std::error_code & aError, const HttpResponse & aResponse)
{
	if (aError)
	{
		return failLogin(aError);
	}

	// A successful login must hand out both a fresh CSRF token and the session cookie:
	auto csrfToken = aResponse.header("X-CSRF-Token");
	auto cookie = cookieFromSetCookie(findAllHeaders(aResponse.headers, "Set-Cookie"));
	if (csrfToken.empty() || cookie.empty() || mSession.csrfToken.empty())
	{
		mLogger->error(fmt::format(
			"{}: The login response lacks the {}, unable to log in.",
			mNvrAddress, csrfToken.empty() ? "CSRF token" : "session cookie"
		));
		return failLogin(Error::LoginIncomplete);
	}

	mSession.csrfToken = csrfToken;
	mSession.cookie = cookie;
	mSession.loggedIn = true;
	mSession.loginAge = mAttemptStartedAt;
	mLogger->debug(fmt::format("{}: Logged in as '{}'.", mNvrAddress, mUsername));
	finishLogin({});
}





void SessionManager::finishLogin(const std::error_code & aError)
{
	mState = mSession.loggedIn ? SessionState::LoggedIn : SessionState::LoggedOut;
	mPendingLogin.settle(aError);
}





void SessionManager::failLogin(const std::error_code & aError)
{
	clearSession();
	finishLogin(aError);
}

}  // namespace ProtectClientPp
