#pragma once

#include <functional>
#include <memory>
#include <system_error>
#include "HttpMessage.hpp"





namespace ProtectClientPp
{





/** The interface for performing a single HTTP request.
HttpsClient is the real implementation; the tests substitute their own. */
class HttpTransport
{
public:

	/** The completion handler for a request.
	If the error code indicates an error, the response contents are undefined. */
	using Callback = std::function<void(const std::error_code & aError, const HttpResponse & aResponse)>;


	/** Represents a request in flight. */
	class PendingRequest
	{
	public:
		virtual ~PendingRequest() {}

		/** Aborts the request as soon as possible.
		The completion handler is still called (with an error), unless it has been called already. */
		virtual void cancel() = 0;
	};


	virtual ~HttpTransport() {}

	/** Starts the request asynchronously.
	The callback is called exactly once, from the io_context's thread.
	Returns the handle that can be used to cancel the request. */
	virtual std::shared_ptr<PendingRequest> send(const HttpRequest & aRequest, Callback aOnFinish) = 0;
};

}  // namespace ProtectClientPp
