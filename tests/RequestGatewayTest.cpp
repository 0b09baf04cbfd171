#include <gtest/gtest.h>
#include "Error.hpp"
#include "Fakes.hpp"
#include "RequestGateway.hpp"





using namespace ProtectClientPp;
using namespace ProtectClientPp::Test;
using namespace std::chrono;





class RequestGatewayTest:
	public ::testing::Test
{
protected:

	asio::io_context mIoc;
	ManualClock mClock;
	ClientConfig mConfig = makeConfig();
	std::shared_ptr<RecordingLogger> mLogger = std::make_shared<RecordingLogger>();
	std::shared_ptr<FakeTransport> mTransport = std::make_shared<FakeTransport>(mIoc);
	std::shared_ptr<RequestGateway> mGateway = RequestGateway::create(mIoc, mTransport, mConfig, mLogger, mClock.function());

	/** The outcome of the last request sent through send(). */
	std::error_code mError;
	HttpResponse mResponse;
	int mNumFinished = 0;


	static ClientConfig makeConfig()
	{
		auto config = testConfig();
		config.apiErrorLimit = 3;
		config.apiRetryInterval = seconds(300);
		return config;
	}

	void send(bool aDecodeJson = true)
	{
		mGateway->send("https://nvr.local/proxy/protect/api/bootstrap", "GET", "", aDecodeJson, true,
			[this](const std::error_code & aError, const HttpResponse & aResponse)
			{
				mError = aError;
				mResponse = aResponse;
				mNumFinished += 1;
			}
		);
	}

	/** Sends a request and lets it fail with the specified status. */
	void sendAndComplete(int aStatus)
	{
		send();
		mTransport->requests.back()->complete(makeResponse(aStatus));
	}
};





TEST_F(RequestGatewayTest, AttachesHeaders)
{
	mGateway->setSessionHeadersSource([]()
		{
			return HttpHeaders{{"X-CSRF-Token", "token"}, {"Cookie", "TOKEN=abc"}};
		}
	);
	send();
	ASSERT_EQ(mTransport->requests.size(), 1u);
	const auto & req = mTransport->requests[0]->request;
	EXPECT_EQ(req.method, "GET");
	EXPECT_EQ(req.url, "https://nvr.local/proxy/protect/api/bootstrap");
	EXPECT_EQ(findHeader(req.headers, "Content-Type"), "application/json");
	EXPECT_EQ(findHeader(req.headers, "X-CSRF-Token"), "token");
	EXPECT_EQ(findHeader(req.headers, "Cookie"), "TOKEN=abc");
}





TEST_F(RequestGatewayTest, DecodesSuccessfulResponse)
{
	mGateway->recordOutcome(false);
	send();
	mTransport->requests[0]->complete(makeResponse(200, {}, R"({"cameras": []})"));
	EXPECT_EQ(mNumFinished, 1);
	EXPECT_FALSE(mError);
	EXPECT_TRUE(mResponse.json.is_object());
	EXPECT_TRUE(mResponse.json["cameras"].is_array());
	EXPECT_EQ(mGateway->errorBudget().consecutiveErrors(), 0u);
	EXPECT_EQ(mGateway->errorBudget().lastSuccessAt(), mClock.now);
	EXPECT_EQ(mGateway->numInFlight(), 0u);
}





TEST_F(RequestGatewayTest, UndecodableBodyIsLeftToCaller)
{
	send();
	mTransport->requests[0]->complete(makeResponse(200, {}, "<html>"));
	EXPECT_FALSE(mError);
	EXPECT_TRUE(mResponse.json.is_discarded());
}





TEST_F(RequestGatewayTest, ClassifiesUnauthorized)
{
	int numAuthFailures = 0;
	mGateway->setOnAuthenticationFailure([&]() { numAuthFailures += 1; });
	sendAndComplete(401);
	EXPECT_EQ(mError, Error::AuthenticationFailed);
	EXPECT_EQ(mError, ErrorKind::Authentication);
	EXPECT_EQ(numAuthFailures, 1);
	EXPECT_EQ(mGateway->errorBudget().consecutiveErrors(), 1u);
	EXPECT_TRUE(mLogger->hasError("Invalid login credentials"));
}





TEST_F(RequestGatewayTest, ClassifiesForbiddenAndOtherStatuses)
{
	sendAndComplete(403);
	EXPECT_EQ(mError, Error::InsufficientPrivileges);
	EXPECT_EQ(mError, ErrorKind::Privilege);
	EXPECT_EQ(mResponse.status, 403);

	sendAndComplete(500);
	EXPECT_EQ(mError, Error::HttpStatus);
	EXPECT_EQ(mError, ErrorKind::Protocol);
	EXPECT_EQ(mGateway->errorBudget().consecutiveErrors(), 2u);
	EXPECT_TRUE(mLogger->hasError("API access error: 500"));
}





TEST_F(RequestGatewayTest, RawModeLeavesClassificationToCaller)
{
	send(false);
	mTransport->requests[0]->complete(makeResponse(500, {}, "oops"));
	EXPECT_FALSE(mError);
	EXPECT_EQ(mResponse.status, 500);
	EXPECT_EQ(mResponse.body, "oops");
	EXPECT_EQ(mGateway->errorBudget().consecutiveErrors(), 0u);

	mGateway->recordOutcome(false);
	EXPECT_EQ(mGateway->errorBudget().consecutiveErrors(), 1u);
}





TEST_F(RequestGatewayTest, TransportErrorsCountAsFailures)
{
	send(false);
	mTransport->requests[0]->fail(asio::error::connection_refused);
	EXPECT_EQ(mError, ErrorKind::Transport);
	EXPECT_EQ(mGateway->errorBudget().consecutiveErrors(), 1u);
	EXPECT_TRUE(mLogger->hasError("connection refused"));
}





TEST_F(RequestGatewayTest, ThrottlesAfterErrorLimit)
{
	sendAndComplete(500);
	sendAndComplete(500);
	sendAndComplete(500);
	ASSERT_EQ(mTransport->requests.size(), 3u);

	// The limit is reached, the next requests fail fast without any I/O:
	send();
	runPending(mIoc);
	EXPECT_EQ(mError, Error::Throttled);
	EXPECT_EQ(mTransport->requests.size(), 3u);
	EXPECT_TRUE(mLogger->hasInfo("Throttling API calls"));
	EXPECT_TRUE(mLogger->hasInfo("5 minutes"));

	mClock.advance(seconds(299));
	send();
	runPending(mIoc);
	EXPECT_EQ(mError, Error::Throttled);
	EXPECT_EQ(mTransport->requests.size(), 3u);

	// Once the retry interval passes, the requests go through again:
	mClock.advance(seconds(2));
	send();
	EXPECT_EQ(mTransport->requests.size(), 4u);
	EXPECT_TRUE(mLogger->hasInfo("Resuming connectivity"));
	mTransport->requests.back()->complete(makeResponse(200, {}, "{}"));
	EXPECT_FALSE(mError);
	EXPECT_EQ(mGateway->errorBudget().consecutiveErrors(), 0u);
}





TEST_F(RequestGatewayTest, TimesOut)
{
	mConfig.requestTimeout = milliseconds(20);
	mGateway = RequestGateway::create(mIoc, mTransport, mConfig, mLogger, mClock.function());
	send();
	mIoc.run();
	EXPECT_EQ(mNumFinished, 1);
	EXPECT_EQ(mError, Error::Timeout);
	EXPECT_EQ(mError, ErrorKind::Timeout);
	EXPECT_TRUE(mTransport->requests[0]->isCancelled);
	EXPECT_EQ(mGateway->errorBudget().consecutiveErrors(), 1u);
	EXPECT_TRUE(mLogger->hasError("taking too long"));
	EXPECT_EQ(mGateway->numInFlight(), 0u);
}





TEST_F(RequestGatewayTest, CancelAllReportsShuttingDown)
{
	send();
	send();
	EXPECT_EQ(mGateway->numInFlight(), 2u);
	mGateway->cancelAll();
	EXPECT_EQ(mNumFinished, 2);
	EXPECT_EQ(mError, Error::ShuttingDown);
	EXPECT_EQ(mGateway->numInFlight(), 0u);
	EXPECT_TRUE(mTransport->requests[0]->isCancelled);
	EXPECT_TRUE(mTransport->requests[1]->isCancelled);
}
