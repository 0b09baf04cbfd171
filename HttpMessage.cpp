#include "HttpMessage.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>





namespace ProtectClientPp
{





/** Returns true if the two strings are equal, ignoring the ASCII letter case. */
static bool equalsNoCase(const std::string & aStr1, const std::string & aStr2)
{
	return std::equal(aStr1.begin(), aStr1.end(), aStr2.begin(), aStr2.end(),
		[](char aCh1, char aCh2)
		{
			return std::tolower(static_cast<unsigned char>(aCh1)) == std::tolower(static_cast<unsigned char>(aCh2));
		}
	);
}





/** Returns true if the string is non-empty and consists of decimal digits only. */
static bool isAllDigits(const std::string & aInput)
{
	if (aInput.empty())
	{
		return false;
	}
	return std::all_of(aInput.begin(), aInput.end(),
		[](char aCh)
		{
			return (std::isdigit(static_cast<unsigned char>(aCh)) != 0);
		}
	);
}





/** Returns the input string with the leading and trailing whitespace removed. */
static std::string trim(const std::string & aInput)
{
	auto first = aInput.find_first_not_of(" \t");
	if (first == std::string::npos)
	{
		return {};
	}
	auto last = aInput.find_last_not_of(" \t\r");
	return aInput.substr(first, last - first + 1);
}





std::string findHeader(const HttpHeaders & aHeaders, const std::string & aName)
{
	for (const auto & hdr: aHeaders)
	{
		if (equalsNoCase(hdr.first, aName))
		{
			return hdr.second;
		}
	}
	return {};
}





std::vector<std::string> findAllHeaders(const HttpHeaders & aHeaders, const std::string & aName)
{
	std::vector<std::string> res;
	for (const auto & hdr: aHeaders)
	{
		if (equalsNoCase(hdr.first, aName))
		{
			res.push_back(hdr.second);
		}
	}
	return res;
}





void setHeader(HttpHeaders & aHeaders, const std::string & aName, const std::string & aValue)
{
	for (auto & hdr: aHeaders)
	{
		if (equalsNoCase(hdr.first, aName))
		{
			hdr.second = aValue;
			return;
		}
	}
	aHeaders.emplace_back(aName, aValue);
}





namespace Http
{





std::string serializeRequest(
	const std::string & aMethod,
	const std::string & aHost,
	const std::string & aTarget,
	const HttpHeaders & aHeaders,
	const std::string & aBody
)
{
	std::string res = fmt::format("{} {} HTTP/1.1\r\nHost: {}\r\n", aMethod, aTarget, aHost);
	bool hasContentLength = false;
	for (const auto & hdr: aHeaders)
	{
		if (equalsNoCase(hdr.first, "Host"))
		{
			continue;
		}
		if (equalsNoCase(hdr.first, "Content-Length"))
		{
			hasContentLength = true;
		}
		res.append(fmt::format("{}: {}\r\n", hdr.first, hdr.second));
	}
	if (!hasContentLength && (!aBody.empty() || (aMethod == "POST") || (aMethod == "PATCH") || (aMethod == "PUT")))
	{
		res.append(fmt::format("Content-Length: {}\r\n", aBody.size()));
	}
	res.append("\r\n");
	res.append(aBody);
	return res;
}





bool parseResponseHead(const std::string & aHead, HttpResponse & aResponse)
{
	// Status line: "HTTP/1.1 200 OK"
	auto lineEnd = aHead.find("\r\n");
	auto statusLine = aHead.substr(0, lineEnd);
	if (statusLine.compare(0, 5, "HTTP/") != 0)
	{
		return false;
	}
	auto sp1 = statusLine.find(' ');
	if (sp1 == std::string::npos)
	{
		return false;
	}
	auto sp2 = statusLine.find(' ', sp1 + 1);
	auto statusStr = statusLine.substr(sp1 + 1, (sp2 == std::string::npos) ? std::string::npos : sp2 - sp1 - 1);
	if ((statusStr.size() != 3) || !isAllDigits(statusStr))
	{
		return false;
	}
	aResponse.status = std::stoi(statusStr);
	aResponse.reason = (sp2 == std::string::npos) ? std::string() : statusLine.substr(sp2 + 1);

	// Header fields:
	aResponse.headers.clear();
	while (lineEnd != std::string::npos)
	{
		auto lineStart = lineEnd + 2;
		lineEnd = aHead.find("\r\n", lineStart);
		auto line = aHead.substr(lineStart, (lineEnd == std::string::npos) ? std::string::npos : lineEnd - lineStart);
		if (line.empty())
		{
			continue;
		}
		if (!parseHeaderLine(line, aResponse.headers))
		{
			return false;
		}
	}
	return true;
}





bool parseHeaderLine(const std::string & aLine, HttpHeaders & aHeaders)
{
	auto colon = aLine.find(':');
	if ((colon == std::string::npos) || (colon == 0))
	{
		return false;
	}
	aHeaders.emplace_back(aLine.substr(0, colon), trim(aLine.substr(colon + 1)));
	return true;
}

}  // namespace Http

}  // namespace ProtectClientPp
