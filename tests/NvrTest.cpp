#include <gtest/gtest.h>
#include "Error.hpp"
#include "Fakes.hpp"
#include "Nvr.hpp"





using namespace ProtectClientPp;
using namespace ProtectClientPp::Test;





class NvrTest:
	public ::testing::Test
{
protected:

	asio::io_context mIoc;
	FakeNvr mNvr;
	std::shared_ptr<RecordingLogger> mLogger = std::make_shared<RecordingLogger>();
	std::shared_ptr<FakeTransport> mTransport = std::make_shared<FakeTransport>(mIoc);
	std::shared_ptr<FakeSocketFactory> mSocketFactory = std::make_shared<FakeSocketFactory>();
	std::shared_ptr<Nvr> mClient = Nvr::create(testConfig(), mLogger, mIoc, mTransport, mSocketFactory);

	/** The outcome of the last camera operation. */
	std::error_code mError;
	Device mDevice;


	NvrTest()
	{
		mNvr.bootstrap = makeBootstrap({makeCamera("A", true), makeCamera("B", true, true)}, {"camera:write,read:*"});
		mTransport->responder = [this](const HttpRequest & aRequest, HttpResponse & aResponse)
		{
			return mNvr(aRequest, aResponse);
		};
	}

	std::error_code refresh()
	{
		std::error_code res = make_error_code(Error::Timeout);
		mClient->refreshDevices([&](const std::error_code & aError)
			{
				res = aError;
			}
		);
		runPending(mIoc);
		return res;
	}

	/** Returns the callback storing the camera operation outcome into mError and mDevice. */
	Nvr::DeviceCallback storeResult()
	{
		return [this](const std::error_code & aError, const Device & aDevice)
		{
			mError = aError;
			mDevice = aDevice;
		};
	}

	/** Returns the device with the specified MAC from the current inventory. */
	Device device(const std::string & aMac)
	{
		for (const auto & d: mClient->devices())
		{
			if (d.mac == aMac)
			{
				return d;
			}
		}
		ADD_FAILURE() << "Device " << aMac << " not found";
		return Device();
	}
};





TEST_F(NvrTest, RefreshPublishesInventory)
{
	EXPECT_TRUE(mClient->devices().empty());
	EXPECT_FALSE(mClient->isAdmin());
	EXPECT_FALSE(refresh());
	EXPECT_EQ(mClient->devices().size(), 2u);
	EXPECT_TRUE(mClient->isAdmin());
	EXPECT_TRUE(mClient->eventChannel()->isConnected());

	// Camera A still has RTSP disabled:
	EXPECT_TRUE(mClient->isAllRtspConfigured());
	mNvr.bootstrap = makeBootstrap({makeCamera("A", true, true), makeCamera("B", true, true)}, {"camera:write,read:*"});
	EXPECT_FALSE(refresh());
	EXPECT_FALSE(mClient->isAllRtspConfigured());
}





TEST_F(NvrTest, EnableRtspPatchesAllChannels)
{
	ASSERT_FALSE(refresh());
	mClient->enableRtsp(device("A"), storeResult());
	runPending(mIoc);
	EXPECT_FALSE(mError);

	ASSERT_EQ(mTransport->count("PATCH", "/proxy/protect/api/cameras/cam-A"), 1u);
	auto body = nlohmann::json::parse(mTransport->requests.back()->request.body);
	ASSERT_EQ(body["channels"].size(), 2u);
	for (const auto & ch: body["channels"])
	{
		EXPECT_EQ(ch["isRtspEnabled"], true);
	}

	// The fields the client doesn't know about are sent back unchanged:
	EXPECT_EQ(body["channels"][0]["rtspAlias"], "abc");

	EXPECT_EQ(mDevice.mac, "A");
	ASSERT_EQ(mDevice.channels.size(), 2u);
	EXPECT_TRUE(mDevice.channels[0].isRtspEnabled);
	EXPECT_TRUE(mDevice.channels[1].isRtspEnabled);
}





TEST_F(NvrTest, EnableRtspSkipsConfiguredCamera)
{
	ASSERT_FALSE(refresh());
	mClient->enableRtsp(device("B"), storeResult());
	runPending(mIoc);
	EXPECT_FALSE(mError);
	EXPECT_EQ(mDevice.mac, "B");
	EXPECT_EQ(mTransport->count("PATCH", "/cam-B"), 0u);
}





TEST_F(NvrTest, NonAdminCannotConfigure)
{
	mNvr.bootstrap = makeBootstrap({makeCamera("A", true)}, {"camera:read:*"});
	ASSERT_FALSE(refresh());
	mClient->enableRtsp(device("A"), storeResult());
	runPending(mIoc);
	EXPECT_EQ(mError, Error::NotAdmin);
	EXPECT_EQ(mError, ErrorKind::Privilege);
	EXPECT_EQ(mTransport->count("PATCH", "/cam-A"), 0u);

	mClient->updateCamera(device("A"), {{"name", "Porch"}}, storeResult());
	runPending(mIoc);
	EXPECT_EQ(mError, Error::NotAdmin);
}





TEST_F(NvrTest, OnlyCamerasCanBeConfigured)
{
	ASSERT_FALSE(refresh());
	auto light = device("A");
	light.modelKey = "light";
	mClient->updateChannels(light, storeResult());
	runPending(mIoc);
	EXPECT_EQ(mError, Error::NotCamera);
	EXPECT_EQ(mTransport->count("PATCH", "/cam-A"), 0u);
}





TEST_F(NvrTest, ForbiddenPatchReturnsOriginalDevice)
{
	ASSERT_FALSE(refresh());
	mNvr.patchStatus = 403;
	mClient->enableRtsp(device("A"), storeResult());
	runPending(mIoc);
	EXPECT_EQ(mError, Error::InsufficientPrivileges);
	EXPECT_FALSE(mDevice.channels[0].isRtspEnabled);
	EXPECT_TRUE(mLogger->hasError("Insufficient privileges to enable RTSP on all channels"));
	EXPECT_EQ(mClient->gateway()->errorBudget().consecutiveErrors(), 1u);

	mNvr.patchStatus = 500;
	mClient->enableRtsp(device("A"), storeResult());
	runPending(mIoc);
	EXPECT_EQ(mError, Error::HttpStatus);
	EXPECT_EQ(mClient->gateway()->errorBudget().consecutiveErrors(), 2u);
}





TEST_F(NvrTest, UpdateCameraSendsPayload)
{
	ASSERT_FALSE(refresh());
	mClient->updateCamera(device("A"), {{"name", "Porch"}}, storeResult());
	runPending(mIoc);
	EXPECT_FALSE(mError);
	EXPECT_EQ(mDevice.name, "Porch");
	auto body = nlohmann::json::parse(mTransport->requests.back()->request.body);
	EXPECT_EQ(body, (nlohmann::json{{"name", "Porch"}}));
}





TEST_F(NvrTest, LoginFetchLogsInFirst)
{
	std::error_code err = make_error_code(Error::Timeout);
	HttpResponse resp;
	mClient->loginFetch("https://nvr.local/proxy/protect/api/bootstrap", "GET", "", true, true,
		[&](const std::error_code & aError, const HttpResponse & aResponse)
		{
			err = aError;
			resp = aResponse;
		}
	);
	runPending(mIoc);
	EXPECT_FALSE(err);
	EXPECT_TRUE(resp.json["cameras"].is_array());
	EXPECT_EQ(mTransport->count("POST", "/api/auth/login"), 1u);
	EXPECT_EQ(findHeader(mTransport->requests.back()->request.headers, "Cookie"), "TOKEN=secret");
}





TEST_F(NvrTest, UnauthorizedResponseClearsSession)
{
	ASSERT_FALSE(refresh());
	auto socket = mSocketFactory->sockets[0];
	mNvr.bootstrapStatus = 401;
	EXPECT_EQ(refresh(), Error::AuthenticationFailed);
	EXPECT_EQ(mClient->sessionManager()->state(), SessionState::LoggedOut);
	EXPECT_TRUE(socket->isTerminated);
	EXPECT_EQ(mClient->bootstrapSync()->snapshot(), nullptr);
	EXPECT_TRUE(mClient->devices().empty());
	EXPECT_FALSE(mClient->isAdmin());
}





TEST_F(NvrTest, ShutdownStopsEverything)
{
	mClient->start();
	runPending(mIoc);
	ASSERT_EQ(mSocketFactory->sockets.size(), 1u);
	EXPECT_EQ(mClient->devices().size(), 2u);

	mClient->shutdown();
	runPending(mIoc);
	EXPECT_TRUE(mSocketFactory->sockets[0]->isTerminated);
	EXPECT_FALSE(mClient->eventChannel()->isConnected());
	EXPECT_EQ(refresh(), Error::ShuttingDown);
}
