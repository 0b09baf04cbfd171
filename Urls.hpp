#pragma once

#include <cstdint>
#include <string>





namespace ProtectClientPp
{





/** The parts of an URL that the transports care about. */
struct Url
{
	std::string scheme;  // "https" or "wss"
	std::string host;
	uint16_t port = 0;
	std::string target;  // Path + query, always starting with a slash

	/** Returns the value to use for the Host header (includes the port if non-default). */
	std::string hostHeader() const;
};





/** The URLs of the NVR API endpoints. */
namespace Urls
{
	/** Parses the URL, returns false if it is not an absolute https / wss URL. */
	bool parse(const std::string & aUrl, Url & aOut);

	/** Percent-encodes the value for use within a query string. */
	std::string encodeQueryValue(const std::string & aValue);

	/** The base address of the NVR, where the CSRF token is requested. */
	std::string baseUrl(const std::string & aNvrAddress);

	std::string authUrl(const std::string & aNvrAddress);
	std::string bootstrapUrl(const std::string & aNvrAddress);

	/** The URL to directly access the cameras; append "/<cameraId>" for a specific one. */
	std::string camerasUrl(const std::string & aNvrAddress);

	/** The realtime system events API; not consumed at the moment. */
	std::string systemUrl(const std::string & aNvrAddress);

	/** The realtime update events API, resumed from the specified update cursor. */
	std::string updatesUrl(const std::string & aNvrAddress, const std::string & aLastUpdateId);
}

}  // namespace ProtectClientPp
