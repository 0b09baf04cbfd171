#include "Urls.hpp"

#include <cctype>
#include <fmt/format.h>





namespace ProtectClientPp
{





std::string Url::hostHeader() const
{
	// IPv6 literals need their brackets back:
	auto hostStr = (host.find(':') == std::string::npos) ? host : ("[" + host + "]");
	if (port == 443)
	{
		return hostStr;
	}
	return fmt::format("{}:{}", hostStr, port);
}





namespace Urls
{





bool parse(const std::string & aUrl, Url & aOut)
{
	auto schemeEnd = aUrl.find("://");
	if (schemeEnd == std::string::npos)
	{
		return false;
	}
	aOut.scheme = aUrl.substr(0, schemeEnd);
	if ((aOut.scheme != "https") && (aOut.scheme != "wss"))
	{
		return false;
	}

	// Split the authority from the target:
	auto authorityStart = schemeEnd + 3;
	auto targetStart = aUrl.find_first_of("/?", authorityStart);
	auto authority = aUrl.substr(authorityStart, (targetStart == std::string::npos) ? std::string::npos : targetStart - authorityStart);
	if (targetStart == std::string::npos)
	{
		aOut.target = "/";
	}
	else
	{
		aOut.target = aUrl.substr(targetStart);
		if (aOut.target[0] == '?')
		{
			aOut.target.insert(0, "/");
		}
	}

	// Split the host from the port; IPv6 literals come in brackets:
	std::string portStr;
	if (!authority.empty() && (authority[0] == '['))
	{
		auto bracketEnd = authority.find(']');
		if (bracketEnd == std::string::npos)
		{
			return false;
		}
		aOut.host = authority.substr(1, bracketEnd - 1);
		if ((bracketEnd + 1 < authority.size()) && (authority[bracketEnd + 1] == ':'))
		{
			portStr = authority.substr(bracketEnd + 2);
		}
	}
	else
	{
		auto colon = authority.find(':');
		aOut.host = authority.substr(0, colon);
		if (colon != std::string::npos)
		{
			portStr = authority.substr(colon + 1);
		}
	}
	if (aOut.host.empty())
	{
		return false;
	}

	if (portStr.empty())
	{
		aOut.port = 443;
		return true;
	}
	if ((portStr.size() > 5) || (portStr.find_first_not_of("0123456789") != std::string::npos))
	{
		return false;
	}
	auto port = std::stoul(portStr);
	if ((port == 0) || (port > 65535))
	{
		return false;
	}
	aOut.port = static_cast<uint16_t>(port);
	return true;
}





std::string encodeQueryValue(const std::string & aValue)
{
	std::string res;
	res.reserve(aValue.size());
	for (auto ch: aValue)
	{
		auto uch = static_cast<unsigned char>(ch);
		if (std::isalnum(uch) || (ch == '-') || (ch == '_') || (ch == '.') || (ch == '~'))
		{
			res.push_back(ch);
		}
		else
		{
			res.append(fmt::format("%{:02X}", uch));
		}
	}
	return res;
}





std::string baseUrl(const std::string & aNvrAddress)
{
	return "https://" + aNvrAddress;
}





std::string authUrl(const std::string & aNvrAddress)
{
	return "https://" + aNvrAddress + "/api/auth/login";
}





std::string bootstrapUrl(const std::string & aNvrAddress)
{
	return "https://" + aNvrAddress + "/proxy/protect/api/bootstrap";
}





std::string camerasUrl(const std::string & aNvrAddress)
{
	return "https://" + aNvrAddress + "/proxy/protect/api/cameras";
}





std::string systemUrl(const std::string & aNvrAddress)
{
	return "wss://" + aNvrAddress + "/api/ws/system";
}





std::string updatesUrl(const std::string & aNvrAddress, const std::string & aLastUpdateId)
{
	return "wss://" + aNvrAddress + "/proxy/protect/ws/updates?lastUpdateId=" + encodeQueryValue(aLastUpdateId);
}

}  // namespace Urls

}  // namespace ProtectClientPp
