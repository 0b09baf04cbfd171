#include <gtest/gtest.h>
#include "Error.hpp"
#include "EventChannel.hpp"
#include "Fakes.hpp"
#include "RequestGateway.hpp"
#include "SessionManager.hpp"





using namespace ProtectClientPp;
using namespace ProtectClientPp::Test;
using namespace std::chrono;





class EventChannelTest:
	public ::testing::Test
{
protected:

	asio::io_context mIoc;
	FakeNvr mNvr;
	ClientConfig mConfig = makeConfig();
	std::shared_ptr<RecordingLogger> mLogger = std::make_shared<RecordingLogger>();
	std::shared_ptr<FakeTransport> mTransport = std::make_shared<FakeTransport>(mIoc);
	std::shared_ptr<FakeSocketFactory> mSocketFactory = std::make_shared<FakeSocketFactory>();
	std::shared_ptr<RequestGateway> mGateway = RequestGateway::create(mIoc, mTransport, mConfig, mLogger);
	std::shared_ptr<SessionManager> mSessionManager = SessionManager::create(mIoc, mGateway, mConfig, mLogger);
	std::shared_ptr<EventChannel> mEventChannel = EventChannel::create(mIoc, mSocketFactory, mSessionManager, mConfig, mLogger);


	EventChannelTest()
	{
		mTransport->responder = [this](const HttpRequest & aRequest, HttpResponse & aResponse)
		{
			return mNvr(aRequest, aResponse);
		};
	}

	static ClientConfig makeConfig()
	{
		auto config = testConfig();
		config.heartbeatInterval = milliseconds(30);
		return config;
	}

	/** Connects the channel and runs the connection attempt to completion, returns its outcome. */
	std::error_code connect(const std::string & aLastUpdateId = "update-1")
	{
		std::error_code res = make_error_code(Error::Timeout);
		mEventChannel->connect(aLastUpdateId, [&](const std::error_code & aError)
			{
				res = aError;
			}
		);
		runPending(mIoc);
		return res;
	}
};





TEST_F(EventChannelTest, KeepsSingleConnection)
{
	EXPECT_FALSE(connect());
	EXPECT_FALSE(connect());
	EXPECT_TRUE(mEventChannel->isConnected());
	ASSERT_EQ(mSocketFactory->sockets.size(), 1u);
	const auto & socket = mSocketFactory->sockets[0];
	EXPECT_EQ(socket->url, "wss://nvr.local/proxy/protect/ws/updates?lastUpdateId=update-1");
	EXPECT_EQ(findHeader(socket->headers, "Cookie"), "TOKEN=secret");
	EXPECT_TRUE(mLogger->hasInfo("Connected to the UniFi realtime update events API"));
	EXPECT_EQ(mTransport->count("POST", "/api/auth/login"), 1u);
}





TEST_F(EventChannelTest, DeliversUpdates)
{
	std::vector<nlohmann::json> updates;
	mEventChannel->setUpdateListener([&](const nlohmann::json & aUpdate)
		{
			updates.push_back(aUpdate);
		}
	);
	EXPECT_FALSE(connect());
	auto socket = mSocketFactory->sockets[0];
	socket->emit(SocketEvent::Opened);
	socket->emit(SocketEvent::Frame, {}, R"({"action": "update", "id": "cam-A"})");
	socket->emit(SocketEvent::Frame, {}, "\x01\x02 binary");
	ASSERT_EQ(updates.size(), 1u);
	EXPECT_EQ(updates[0]["action"], "update");
	EXPECT_TRUE(mEventChannel->isConnected());
}





TEST_F(EventChannelTest, SilentConnectionIsTerminated)
{
	EXPECT_FALSE(connect());
	auto socket = mSocketFactory->sockets[0];
	socket->emit(SocketEvent::Opened);
	EXPECT_TRUE(mEventChannel->isConnected());

	mIoc.restart();
	mIoc.run_for(seconds(2));
	EXPECT_FALSE(mEventChannel->isConnected());
	EXPECT_TRUE(socket->isTerminated);
	EXPECT_TRUE(mLogger->hasError("No traffic"));

	// Only the connection is dropped, the session stays:
	EXPECT_EQ(mSessionManager->state(), SessionState::LoggedIn);

	// The next connect makes a new connection:
	EXPECT_FALSE(connect());
	EXPECT_EQ(mSocketFactory->sockets.size(), 2u);
	EXPECT_TRUE(mEventChannel->isConnected());
}





TEST_F(EventChannelTest, ClosedConnectionIsForgotten)
{
	EXPECT_FALSE(connect());
	auto socket = mSocketFactory->sockets[0];
	socket->emit(SocketEvent::Opened);
	socket->emit(SocketEvent::Closed);
	EXPECT_FALSE(mEventChannel->isConnected());
	EXPECT_TRUE(socket->isTerminated);
	EXPECT_TRUE(mLogger->errors.empty());

	EXPECT_FALSE(connect());
	EXPECT_EQ(mSocketFactory->sockets.size(), 2u);
}





TEST_F(EventChannelTest, FailedConnectionIsTornDown)
{
	EXPECT_FALSE(connect());
	auto socket = mSocketFactory->sockets[0];
	socket->emit(SocketEvent::Opened);
	socket->emit(SocketEvent::Failed, make_error_code(Error::UpgradeRejected));
	EXPECT_FALSE(mEventChannel->isConnected());
	EXPECT_TRUE(socket->isTerminated);
	EXPECT_EQ(mLogger->errors.size(), 1u);
}





TEST_F(EventChannelTest, FactoryFailureIsReported)
{
	mSocketFactory->failNextWith = asio::error::host_not_found;
	auto err = connect();
	EXPECT_EQ(err, asio::error::host_not_found);
	EXPECT_FALSE(mEventChannel->isConnected());
	EXPECT_TRUE(mSocketFactory->sockets.empty());
	EXPECT_TRUE(mLogger->hasError("Unable to connect to the realtime update events API"));

	// No retry on its own:
	runPending(mIoc);
	EXPECT_TRUE(mSocketFactory->sockets.empty());
}





TEST_F(EventChannelTest, LoginFailureIsReported)
{
	mNvr.loginStatus = 401;
	EXPECT_EQ(connect(), Error::AuthenticationFailed);
	EXPECT_TRUE(mSocketFactory->sockets.empty());
}





TEST_F(EventChannelTest, TerminatedSocketReportsNothing)
{
	EXPECT_FALSE(connect());
	auto socket = mSocketFactory->sockets[0];
	auto handler = socket->handler;
	mEventChannel->shutdown();

	// A socket terminated before being established still reports its failure; it belongs to a forgotten connection:
	handler(SocketEvent::Failed, make_error_code(Error::ClosedBeforeEstablished), {});
	EXPECT_TRUE(mLogger->errors.empty());
	EXPECT_FALSE(mEventChannel->isConnected());
}





TEST_F(EventChannelTest, ShutdownPreventsConnecting)
{
	EXPECT_FALSE(connect());
	auto socket = mSocketFactory->sockets[0];
	mEventChannel->shutdown();
	EXPECT_TRUE(socket->isTerminated);
	EXPECT_FALSE(mEventChannel->isConnected());

	EXPECT_EQ(connect(), Error::ShuttingDown);
	EXPECT_EQ(mSocketFactory->sockets.size(), 1u);
}






TEST(EventChannelClockTest, AnyTrafficPushesDeadlineOut)
{
	asio::io_context ioc;
	ManualClock clock;
	FakeNvr nvr;
	auto config = testConfig();
	config.heartbeatInterval = milliseconds(30);
	auto logger = std::make_shared<RecordingLogger>();
	auto transport = std::make_shared<FakeTransport>(ioc);
	transport->responder = [&nvr](const HttpRequest & aRequest, HttpResponse & aResponse)
	{
		return nvr(aRequest, aResponse);
	};
	auto socketFactory = std::make_shared<FakeSocketFactory>();
	auto gateway = RequestGateway::create(ioc, transport, config, logger);
	auto sessionManager = SessionManager::create(ioc, gateway, config, logger);
	auto eventChannel = EventChannel::create(ioc, socketFactory, sessionManager, config, logger, clock.function());

	std::error_code err = make_error_code(Error::Timeout);
	eventChannel->connect("update-1", [&err](const std::error_code & aError) { err = aError; });
	runPending(ioc);
	ASSERT_FALSE(err);
	auto socket = socketFactory->sockets[0];
	socket->emit(SocketEvent::Opened);

	// A protocol ping counts as traffic, the timer keeps being re-armed while the clock stays within the interval:
	clock.advance(milliseconds(20));
	socket->emit(SocketEvent::Ping);
	clock.advance(milliseconds(20));
	ioc.restart();
	ioc.run_for(milliseconds(100));
	EXPECT_TRUE(eventChannel->isConnected());
	EXPECT_FALSE(socket->isTerminated);

	// Once the clock passes the deadline, the next timer expiry tears the connection down:
	clock.advance(milliseconds(20));
	ioc.restart();
	ioc.run_for(milliseconds(200));
	EXPECT_FALSE(eventChannel->isConnected());
	EXPECT_TRUE(socket->isTerminated);
	EXPECT_TRUE(logger->hasError("No traffic"));
}
