#include <gtest/gtest.h>
#include <fstream>
#include "ClientConfig.hpp"
#include "Error.hpp"





using namespace ProtectClientPp;
using namespace std::chrono;





TEST(ClientConfigTest, Defaults)
{
	std::error_code err;
	auto config = ClientConfig::fromJson({{"address", "nvr.local"}, {"username", "u"}, {"password", "p"}}, err);
	ASSERT_FALSE(err);
	EXPECT_EQ(config.address, "nvr.local");
	EXPECT_FALSE(config.verifyTlsCertificates);
	EXPECT_FALSE(config.debug);
	EXPECT_EQ(config.apiErrorLimit, 10u);
	EXPECT_EQ(config.apiRetryInterval, seconds(300));
	EXPECT_EQ(config.requestTimeout, milliseconds(3500));
	EXPECT_EQ(config.heartbeatInterval, seconds(10));
	EXPECT_EQ(config.loginRefreshInterval, seconds(1800));
	EXPECT_EQ(config.refreshInterval, seconds(10));
}





TEST(ClientConfigTest, OverridesInSeconds)
{
	std::error_code err;
	auto config = ClientConfig::fromJson(
		{
			{"address", "10.0.0.1:7443"},
			{"username", "u"},
			{"password", "p"},
			{"verifyTlsCertificates", true},
			{"apiErrorLimit", 5},
			{"requestTimeout", 2.5},
			{"heartbeatInterval", 30},
		},
		err
	);
	ASSERT_FALSE(err);
	EXPECT_TRUE(config.verifyTlsCertificates);
	EXPECT_EQ(config.apiErrorLimit, 5u);
	EXPECT_EQ(config.requestTimeout, milliseconds(2500));
	EXPECT_EQ(config.heartbeatInterval, seconds(30));
}





TEST(ClientConfigTest, RejectsInvalidConfig)
{
	std::error_code err;
	ClientConfig::fromJson({{"address", "nvr.local"}, {"username", "u"}}, err);
	EXPECT_EQ(err, Error::InvalidConfig);

	ClientConfig::fromJson({{"address", 5}, {"username", "u"}, {"password", "p"}}, err);
	EXPECT_EQ(err, Error::InvalidConfig);

	ClientConfig::fromJson({{"address", "a"}, {"username", "u"}, {"password", "p"}, {"requestTimeout", -1}}, err);
	EXPECT_EQ(err, Error::InvalidConfig);

	ClientConfig::fromJson(nlohmann::json::array(), err);
	EXPECT_EQ(err, Error::InvalidConfig);
}





TEST(ClientConfigTest, LoadsFromFile)
{
	auto fileName = ::testing::TempDir() + "ClientConfigTest.json";
	{
		std::ofstream f(fileName);
		f << R"({"address": "nvr.local", "username": "u", "password": "p", "debug": true})";
	}
	std::error_code err;
	auto config = ClientConfig::load(fileName, err);
	ASSERT_FALSE(err);
	EXPECT_EQ(config.username, "u");
	EXPECT_TRUE(config.debug);

	ClientConfig::load(::testing::TempDir() + "NoSuchConfig.json", err);
	EXPECT_TRUE(err);
}
