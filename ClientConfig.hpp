#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <system_error>
#include <nlohmann/json.hpp>





namespace ProtectClientPp
{





using Clock = std::chrono::steady_clock;

/** The source of "now" for all timing decisions, so that tests can substitute a manual clock. */
using NowFunction = std::function<Clock::time_point()>;





/** The settings for a single NVR client instance. */
struct ClientConfig
{
	/** The hostname or IP address of the NVR (no scheme, optionally with ":port"). */
	std::string address;

	std::string username;
	std::string password;

	/** If false (default), the server certificates are not validated at all.
	The NVRs are local-network appliances with self-signed certificates, so this is a deliberate trust decision. */
	bool verifyTlsCertificates = false;

	/** Whether to output debug log messages. */
	bool debug = false;

	/** Number of consecutive failed API calls after which the API calls get throttled. */
	unsigned apiErrorLimit = 10;

	/** How long the API calls stay throttled once apiErrorLimit is reached. */
	std::chrono::milliseconds apiRetryInterval = std::chrono::seconds(300);

	/** The maximum duration of a single API request. */
	std::chrono::milliseconds requestTimeout = std::chrono::milliseconds(3500);

	/** If no frame arrives on the realtime update connection within this interval, the connection is dropped. */
	std::chrono::milliseconds heartbeatInterval = std::chrono::seconds(10);

	/** Maximum age of a login session, after which a fresh login is made. */
	std::chrono::milliseconds loginRefreshInterval = std::chrono::seconds(1800);

	/** The interval between the scheduled inventory refreshes. */
	std::chrono::milliseconds refreshInterval = std::chrono::seconds(10);


	/** Reads the config from the JSON object.
	Unspecified values keep their defaults; the durations are given in (fractional) seconds.
	On error, sets aError and returns a default-constructed config. */
	static ClientConfig fromJson(const nlohmann::json & aJson, std::error_code & aError);

	/** Reads the config from the specified JSON file.
	On error, sets aError and returns a default-constructed config. */
	static ClientConfig load(const std::string & aFileName, std::error_code & aError);
};

}  // namespace ProtectClientPp
