#pragma once

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>





namespace ProtectClientPp
{





/** HTTP header fields, in the order of appearance. Names are compared case-insensitively. */
using HttpHeaders = std::vector<std::pair<std::string, std::string>>;





/** Returns the value of the first header of the specified name (case-insensitive), or empty string if not present. */
std::string findHeader(const HttpHeaders & aHeaders, const std::string & aName);

/** Returns the values of all the headers of the specified name (case-insensitive). */
std::vector<std::string> findAllHeaders(const HttpHeaders & aHeaders, const std::string & aName);

/** Replaces the value of the header of the specified name, or adds the header if not present yet. */
void setHeader(HttpHeaders & aHeaders, const std::string & aName, const std::string & aValue);





struct HttpRequest
{
	std::string method;
	std::string url;
	HttpHeaders headers;
	std::string body;
};





struct HttpResponse
{
	int status = 0;
	std::string reason;
	HttpHeaders headers;
	std::string body;

	/** The body parsed as JSON.
	Only filled in by RequestGateway for successful responses when decoding was requested;
	a body that failed to parse is represented by a discarded value. */
	nlohmann::json json;


	/** Returns true for 2xx statuses. */
	bool isOk() const { return (status >= 200) && (status < 300); }

	std::string header(const std::string & aName) const { return findHeader(headers, aName); }
};





namespace Http
{
	/** Serializes the request into the HTTP/1.1 on-wire format, used for the WebSocket upgrade.
	aHost is used for the Host header, aTarget is the request-target (path + query). */
	std::string serializeRequest(
		const std::string & aMethod,
		const std::string & aHost,
		const std::string & aTarget,
		const HttpHeaders & aHeaders,
		const std::string & aBody
	);

	/** Parses the status line and the headers, up to (but not including) the empty line.
	Returns false if the data is not a valid HTTP response head. */
	bool parseResponseHead(const std::string & aHead, HttpResponse & aResponse);

	/** Parses a single "Name: value" header line (without the line ending) and appends it to aHeaders.
	Returns false if the line is not a header field. */
	bool parseHeaderLine(const std::string & aLine, HttpHeaders & aHeaders);
}

}  // namespace ProtectClientPp
