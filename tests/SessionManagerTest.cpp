#include <gtest/gtest.h>
#include "Error.hpp"
#include "Fakes.hpp"
#include "RequestGateway.hpp"
#include "SessionManager.hpp"





using namespace ProtectClientPp;
using namespace ProtectClientPp::Test;
using namespace std::chrono;





class SessionManagerTest:
	public ::testing::Test
{
protected:

	asio::io_context mIoc;
	ManualClock mClock;
	ClientConfig mConfig = testConfig();
	std::shared_ptr<RecordingLogger> mLogger = std::make_shared<RecordingLogger>();
	std::shared_ptr<FakeTransport> mTransport = std::make_shared<FakeTransport>(mIoc);
	std::shared_ptr<RequestGateway> mGateway = RequestGateway::create(mIoc, mTransport, mConfig, mLogger, mClock.function());
	std::shared_ptr<SessionManager> mSessionManager = SessionManager::create(mIoc, mGateway, mConfig, mLogger, mClock.function());

	std::vector<std::error_code> mResults;


	void ensureLoggedIn()
	{
		mSessionManager->ensureLoggedIn([this](const std::error_code & aError)
			{
				mResults.push_back(aError);
			}
		);
	}

	/** Answers the pending CSRF token request with a token. */
	void answerCsrfRequest()
	{
		auto & csrfRequest = mTransport->requests.back();
		ASSERT_EQ(csrfRequest->request.method, "GET");
		ASSERT_EQ(csrfRequest->request.url, "https://nvr.local");
		csrfRequest->complete(makeResponse(200, {{"X-CSRF-Token", "csrf-token"}}));
	}

	/** Answers the pending login request with the specified headers. */
	void answerLogin(HttpHeaders aHeaders)
	{
		auto & login = mTransport->requests.back();
		ASSERT_EQ(login->request.method, "POST");
		ASSERT_EQ(login->request.url, "https://nvr.local/api/auth/login");
		login->complete(makeResponse(200, std::move(aHeaders), "{}"));
	}

	void logIn()
	{
		ensureLoggedIn();
		answerCsrfRequest();
		answerLogin({{"X-CSRF-Token", "session-token"}, {"Set-Cookie", "TOKEN=secret; path=/; httponly"}});
	}
};





TEST_F(SessionManagerTest, ConcurrentCallersShareOneLogin)
{
	for (int i = 0; i < 5; ++i)
	{
		ensureLoggedIn();
	}
	EXPECT_TRUE(mSessionManager->isLoginPending());
	EXPECT_EQ(mSessionManager->state(), SessionState::AcquiringToken);
	ASSERT_EQ(mTransport->requests.size(), 1u);
	answerCsrfRequest();

	EXPECT_EQ(mSessionManager->state(), SessionState::LoggingIn);
	ASSERT_EQ(mTransport->requests.size(), 2u);
	auto body = nlohmann::json::parse(mTransport->requests[1]->request.body);
	EXPECT_EQ(body["username"], "admin");
	EXPECT_EQ(body["password"], "pass");
	answerLogin({{"X-CSRF-Token", "session-token"}, {"Set-Cookie", "TOKEN=secret; path=/; httponly"}});

	ASSERT_EQ(mResults.size(), 5u);
	for (const auto & err: mResults)
	{
		EXPECT_FALSE(err);
	}
	EXPECT_EQ(mTransport->count("POST", "/api/auth/login"), 1u);
	EXPECT_FALSE(mSessionManager->isLoginPending());
	EXPECT_EQ(mSessionManager->state(), SessionState::LoggedIn);

	const auto & session = mSessionManager->session();
	EXPECT_TRUE(session.loggedIn);
	EXPECT_EQ(session.csrfToken, "session-token");
	EXPECT_EQ(session.cookie, "TOKEN=secret");
	EXPECT_EQ(session.loginAge, mClock.now);
	EXPECT_EQ(findHeader(session.headers(), "X-CSRF-Token"), "session-token");
	EXPECT_EQ(findHeader(session.headers(), "Cookie"), "TOKEN=secret");
}





TEST_F(SessionManagerTest, ValidSessionNeedsNoRequests)
{
	logIn();
	ASSERT_EQ(mResults.size(), 1u);
	ensureLoggedIn();
	EXPECT_EQ(mTransport->requests.size(), 2u);

	// The outcome is delivered asynchronously:
	EXPECT_EQ(mResults.size(), 1u);
	runPending(mIoc);
	ASSERT_EQ(mResults.size(), 2u);
	EXPECT_FALSE(mResults[1]);
}





TEST_F(SessionManagerTest, ExpiredSessionLogsInAgain)
{
	int numCleared = 0;
	mSessionManager->addOnSessionCleared([&]() { numCleared += 1; });
	logIn();
	mClock.advance(mConfig.loginRefreshInterval + seconds(1));
	ensureLoggedIn();
	EXPECT_EQ(numCleared, 1);
	EXPECT_FALSE(mSessionManager->session().loggedIn);

	// Everything was reset, including the CSRF token, so the whole dance starts over:
	ASSERT_EQ(mTransport->requests.size(), 3u);
	answerCsrfRequest();
	answerLogin({{"X-CSRF-Token", "token-2"}, {"Set-Cookie", "TOKEN=second"}});
	ASSERT_EQ(mResults.size(), 2u);
	EXPECT_FALSE(mResults[1]);
	EXPECT_EQ(mSessionManager->session().cookie, "TOKEN=second");
}





TEST_F(SessionManagerTest, LoginWithoutCookieFails)
{
	ensureLoggedIn();
	answerCsrfRequest();
	answerLogin({{"X-CSRF-Token", "session-token"}});
	ASSERT_EQ(mResults.size(), 1u);
	EXPECT_EQ(mResults[0], Error::LoginIncomplete);
	EXPECT_EQ(mResults[0], ErrorKind::Authentication);
	EXPECT_EQ(mSessionManager->state(), SessionState::LoggedOut);
	EXPECT_TRUE(mSessionManager->session().csrfToken.empty());
	EXPECT_FALSE(mSessionManager->isLoginPending());
}





TEST_F(SessionManagerTest, LoginWithoutTokenFails)
{
	ensureLoggedIn();
	answerCsrfRequest();
	answerLogin({{"Set-Cookie", "TOKEN=secret"}});
	ASSERT_EQ(mResults.size(), 1u);
	EXPECT_EQ(mResults[0], Error::LoginIncomplete);
	EXPECT_TRUE(mSessionManager->session().cookie.empty());
}





TEST_F(SessionManagerTest, CsrfRequestWithoutTokenFails)
{
	ensureLoggedIn();
	mTransport->requests[0]->complete(makeResponse(200));
	ASSERT_EQ(mResults.size(), 1u);
	EXPECT_EQ(mResults[0], Error::TokenUnavailable);
	EXPECT_EQ(mTransport->requests.size(), 1u);
	EXPECT_EQ(mSessionManager->state(), SessionState::LoggedOut);

	// The next attempt starts from scratch:
	ensureLoggedIn();
	EXPECT_EQ(mTransport->requests.size(), 2u);
}





TEST_F(SessionManagerTest, BadCredentialsFail)
{
	ensureLoggedIn();
	answerCsrfRequest();
	mTransport->requests.back()->complete(makeResponse(401));
	ASSERT_EQ(mResults.size(), 1u);
	EXPECT_EQ(mResults[0], Error::AuthenticationFailed);
	EXPECT_FALSE(mSessionManager->session().loggedIn);
}





TEST_F(SessionManagerTest, ClearSessionResetsEverything)
{
	int numCleared = 0;
	mSessionManager->addOnSessionCleared([&]() { numCleared += 1; });
	logIn();
	mSessionManager->setAdmin(true);
	mSessionManager->clearSession();
	EXPECT_EQ(numCleared, 1);
	const auto & session = mSessionManager->session();
	EXPECT_FALSE(session.loggedIn);
	EXPECT_FALSE(session.isAdmin);
	EXPECT_TRUE(session.csrfToken.empty());
	EXPECT_TRUE(session.cookie.empty());
	EXPECT_TRUE(session.headers().empty());
}





TEST(SessionManagerCookieTest, KeepsOnlyNameValue)
{
	EXPECT_EQ(
		SessionManager::cookieFromSetCookie({"TOKEN=abc; path=/; samesite=strict; secure; httponly", " other=1 ", "invalid"}),
		"TOKEN=abc; other=1"
	);
	EXPECT_EQ(SessionManager::cookieFromSetCookie({}), "");
}
