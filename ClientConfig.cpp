#include "ClientConfig.hpp"

#include <fstream>
#include "Error.hpp"





namespace ProtectClientPp
{





/** If the specified key is present in the JSON object as a number, stores it into aOut as a duration in seconds.
Returns false if the key is present but is not a non-negative number. */
static bool readSeconds(const nlohmann::json & aJson, const char * aKey, std::chrono::milliseconds & aOut)
{
	auto itr = aJson.find(aKey);
	if (itr == aJson.end())
	{
		return true;
	}
	if (!itr->is_number() || (itr->get<double>() < 0))
	{
		return false;
	}
	aOut = std::chrono::milliseconds(static_cast<long long>(itr->get<double>() * 1000));
	return true;
}





/** If the specified key is present in the JSON object as a string, stores it into aOut. */
static bool readString(const nlohmann::json & aJson, const char * aKey, std::string & aOut)
{
	auto itr = aJson.find(aKey);
	if (itr == aJson.end())
	{
		return true;
	}
	if (!itr->is_string())
	{
		return false;
	}
	aOut = itr->get<std::string>();
	return true;
}





/** If the specified key is present in the JSON object as a bool, stores it into aOut. */
static bool readBool(const nlohmann::json & aJson, const char * aKey, bool & aOut)
{
	auto itr = aJson.find(aKey);
	if (itr == aJson.end())
	{
		return true;
	}
	if (!itr->is_boolean())
	{
		return false;
	}
	aOut = itr->get<bool>();
	return true;
}





ClientConfig ClientConfig::fromJson(const nlohmann::json & aJson, std::error_code & aError)
{
	aError.clear();
	ClientConfig res;
	if (!aJson.is_object())
	{
		aError = Error::InvalidConfig;
		return {};
	}

	bool isValid =
		readString(aJson,  "address",               res.address) &&
		readString(aJson,  "username",              res.username) &&
		readString(aJson,  "password",              res.password) &&
		readBool(aJson,    "verifyTlsCertificates", res.verifyTlsCertificates) &&
		readBool(aJson,    "debug",                 res.debug) &&
		readSeconds(aJson, "apiRetryInterval",      res.apiRetryInterval) &&
		readSeconds(aJson, "requestTimeout",        res.requestTimeout) &&
		readSeconds(aJson, "heartbeatInterval",     res.heartbeatInterval) &&
		readSeconds(aJson, "loginRefreshInterval",  res.loginRefreshInterval) &&
		readSeconds(aJson, "refreshInterval",       res.refreshInterval);

	auto itr = aJson.find("apiErrorLimit");
	if (itr != aJson.end())
	{
		if (!itr->is_number_unsigned())
		{
			isValid = false;
		}
		else
		{
			res.apiErrorLimit = itr->get<unsigned>();
		}
	}

	// The NVR address and the credentials are mandatory:
	if (!isValid || res.address.empty() || res.username.empty() || res.password.empty())
	{
		aError = Error::InvalidConfig;
		return {};
	}
	return res;
}





ClientConfig ClientConfig::load(const std::string & aFileName, std::error_code & aError)
{
	std::ifstream f(aFileName);
	if (!f.good())
	{
		aError = std::make_error_code(std::errc::no_such_file_or_directory);
		return {};
	}
	auto j = nlohmann::json::parse(f, nullptr, false);
	if (j.is_discarded())
	{
		aError = Error::InvalidConfig;
		return {};
	}
	return fromJson(j, aError);
}

}  // namespace ProtectClientPp
