#pragma once

#include <map>
#include <memory>
#include <asio.hpp>
#include "ClientConfig.hpp"
#include "ErrorBudget.hpp"
#include "HttpTransport.hpp"
#include "Logger.hpp"





namespace ProtectClientPp
{





/** The single entry point for all HTTP API requests to the NVR.
Applies the throttling policy, attaches the session headers, enforces the request timeout, classifies the outcome
and keeps the ErrorBudget up to date.
All methods must be called from the io_context's thread; all callbacks are called from it as well. */
class RequestGateway:
	public std::enable_shared_from_this<RequestGateway>
{
public:

	using Callback = HttpTransport::Callback;


	/** Creates a new instance, wrapped in a shared_ptr (required for lifetime management of the async handlers).
	If aNow is empty, the steady clock is used. */
	static std::shared_ptr<RequestGateway> create(
		asio::io_context & aIoContext,
		std::shared_ptr<HttpTransport> aTransport,
		const ClientConfig & aConfig,
		std::shared_ptr<Logger> aLogger,
		NowFunction aNow = nullptr
	);

	/** Sets the function that provides the current session headers (CSRF token, cookie) for each request. */
	void setSessionHeadersSource(std::function<HttpHeaders()> aSource) { mSessionHeadersSource = std::move(aSource); }

	/** Sets the function to call when the NVR rejects our credentials (HTTP 401). */
	void setOnAuthenticationFailure(std::function<void()> aHandler) { mOnAuthenticationFailure = std::move(aHandler); }

	/** Sets the function that provides the NVR name for the log messages. */
	void setNameSource(std::function<std::string()> aSource) { mNameSource = std::move(aSource); }

	/** Sends the request asynchronously.
	If aDecodeJson is true, the HTTP status is classified (401, 403 and other non-2xx statuses are reported as errors)
	and a successful response's body is parsed into HttpResponse::json. Otherwise the response is handed over as-is
	and the caller is responsible for classifying it and reporting the outcome via recordOutcome().
	Network-level errors and timeouts are reported as errors in both cases.
	If aLogErrors is false, the unclassified network errors are not logged. */
	void send(
		const std::string & aUrl,
		const std::string & aMethod,
		const std::string & aBody,
		bool aDecodeJson,
		bool aLogErrors,
		Callback aOnFinish
	);

	/** Sends a request with decoding and error logging enabled. */
	void send(const std::string & aUrl, const std::string & aMethod, const std::string & aBody, Callback aOnFinish)
	{
		send(aUrl, aMethod, aBody, true, true, std::move(aOnFinish));
	}

	/** Records the outcome of a request whose classification the caller took over (aDecodeJson == false). */
	void recordOutcome(bool aSuccess);

	/** Cancels all requests in flight, their callbacks get called with Error::ShuttingDown. */
	void cancelAll();

	/** Returns the current state of the error budget. Used for diagnostics and tests. */
	const ErrorBudget & errorBudget() const { return mErrorBudget; }

	/** Returns the number of requests currently in flight. */
	size_t numInFlight() const { return mInFlight.size(); }


protected:

	/** A single request in flight. */
	struct InFlight
	{
		std::shared_ptr<HttpTransport::PendingRequest> mRequest;
		asio::steady_timer mTimeoutTimer;
		Callback mOnFinish;
		bool mDecodeJson;
		bool mLogErrors;

		InFlight(asio::io_context & aIoContext, Callback aOnFinish, bool aDecodeJson, bool aLogErrors):
			mTimeoutTimer(aIoContext),
			mOnFinish(std::move(aOnFinish)),
			mDecodeJson(aDecodeJson),
			mLogErrors(aLogErrors)
		{
		}
	};


	asio::io_context & mIoContext;
	std::shared_ptr<HttpTransport> mTransport;
	std::shared_ptr<Logger> mLogger;
	NowFunction mNow;
	Clock::duration mRequestTimeout;
	ErrorBudget mErrorBudget;

	std::function<HttpHeaders()> mSessionHeadersSource;
	std::function<void()> mOnAuthenticationFailure;
	std::function<std::string()> mNameSource;

	/** The requests in flight, keyed by their sequence number. */
	std::map<uint64_t, std::shared_ptr<InFlight>> mInFlight;

	/** The sequence number to assign to the next request. */
	uint64_t mNextRequestID;


	RequestGateway(
		asio::io_context & aIoContext,
		std::shared_ptr<HttpTransport> aTransport,
		const ClientConfig & aConfig,
		std::shared_ptr<Logger> aLogger,
		NowFunction aNow
	);

	/** Returns the NVR name to use in the log messages. */
	std::string nvrName() const;

	/** Removes the request from mInFlight and returns it.
	Returns nullptr if the request has already finished (timed out, cancelled). */
	std::shared_ptr<InFlight> extractInFlight(uint64_t aRequestID);

	/** Called by the transport when the request finishes. */
	void onTransportFinished(uint64_t aRequestID, const std::error_code & aError, const HttpResponse & aResponse);

	/** Called by ASIO when the request's timeout timer fires (or is cancelled). */
	void onTimeout(uint64_t aRequestID, const std::error_code & aError);

	/** Classifies the HTTP status of a finished request, updates the error budget and calls the callback. */
	void classifyResponse(InFlight & aInFlight, const HttpResponse & aResponse);

	/** Logs the network-level error, with special messages for the typical cases. */
	void logTransportError(const std::error_code & aError, bool aLogErrors);
};

}  // namespace ProtectClientPp
