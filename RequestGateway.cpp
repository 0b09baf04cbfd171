#include "RequestGateway.hpp"

#include <fmt/format.h>
#include "Error.hpp"





namespace ProtectClientPp
{





std::shared_ptr<RequestGateway> RequestGateway::create(
	asio::io_context & aIoContext,
	std::shared_ptr<HttpTransport> aTransport,
	const ClientConfig & aConfig,
	std::shared_ptr<Logger> aLogger,
	NowFunction aNow
)
{
	return std::shared_ptr<RequestGateway>(new RequestGateway(aIoContext, std::move(aTransport), aConfig, std::move(aLogger), std::move(aNow)));
}





RequestGateway::RequestGateway(
	asio::io_context & aIoContext,
	std::shared_ptr<HttpTransport> aTransport,
	const ClientConfig & aConfig,
	std::shared_ptr<Logger> aLogger,
	NowFunction aNow
):
	mIoContext(aIoContext),
	mTransport(std::move(aTransport)),
	mLogger(std::move(aLogger)),
	mNow(aNow ? std::move(aNow) : NowFunction(&Clock::now)),
	mRequestTimeout(aConfig.requestTimeout),
	mErrorBudget(aConfig.apiErrorLimit, aConfig.apiRetryInterval),
	mNextRequestID(0)
{
}





void RequestGateway::send(
	const std::string & aUrl,
	const std::string & aMethod,
	const std::string & aBody,
	bool aDecodeJson,
	bool aLogErrors,
	Callback aOnFinish
)
{
	// Throttle the API calls if there were too many errors:
	switch (mErrorBudget.shouldThrottle(mNow()))
	{
		case ThrottleDecision::Proceed:
		{
			break;
		}
		case ThrottleDecision::ThrottleStarted:
		{
			mLogger->info(fmt::format(
				"{}: Throttling API calls due to errors with the {} previous attempts. I'll retry again in {} minutes.",
				nvrName(), mErrorBudget.errorLimit(),
				std::chrono::duration_cast<std::chrono::duration<double, std::ratio<60>>>(mErrorBudget.retryInterval()).count()
			));
			asio::post(mIoContext, [aOnFinish]() { aOnFinish(Error::Throttled, {}); });
			return;
		}
		case ThrottleDecision::Throttled:
		{
			asio::post(mIoContext, [aOnFinish]() { aOnFinish(Error::Throttled, {}); });
			return;
		}
		case ThrottleDecision::Resumed:
		{
			mLogger->info(fmt::format(
				"{}: Resuming connectivity to the UniFi Protect API after throttling for {} minutes.",
				nvrName(),
				std::chrono::duration_cast<std::chrono::duration<double, std::ratio<60>>>(mErrorBudget.retryInterval()).count()
			));
			break;
		}
	}

	HttpRequest req;
	req.method = aMethod;
	req.url = aUrl;
	req.body = aBody;
	setHeader(req.headers, "Content-Type", "application/json");
	if (mSessionHeadersSource)
	{
		for (const auto & hdr: mSessionHeadersSource())
		{
			setHeader(req.headers, hdr.first, hdr.second);
		}
	}

	// Register the request and arm its timeout before starting it, the transport may finish synchronously:
	auto requestID = mNextRequestID++;
	auto inFlight = std::make_shared<InFlight>(mIoContext, std::move(aOnFinish), aDecodeJson, aLogErrors);
	mInFlight[requestID] = inFlight;
	inFlight->mTimeoutTimer.expires_after(mRequestTimeout);
	inFlight->mTimeoutTimer.async_wait(
		[self = shared_from_this(), requestID](const std::error_code & aError)
		{
			self->onTimeout(requestID, aError);
		}
	);
	inFlight->mRequest = mTransport->send(req,
		[self = shared_from_this(), requestID](const std::error_code & aError, const HttpResponse & aResponse)
		{
			self->onTransportFinished(requestID, aError, aResponse);
		}
	);
}





void RequestGateway::recordOutcome(bool aSuccess)
{
	mErrorBudget.recordOutcome(aSuccess, mNow());
}





void RequestGateway::cancelAll()
{
	decltype(mInFlight) inFlight;
	std::swap(inFlight, mInFlight);
	for (const auto & itr: inFlight)
	{
		const auto & req = itr.second;
		req->mTimeoutTimer.cancel();
		if (req->mRequest != nullptr)
		{
			req->mRequest->cancel();
		}
		req->mOnFinish(Error::ShuttingDown, {});
	}
}





std::string RequestGateway::nvrName() const
{
	return mNameSource ? mNameSource() : std::string("NVR");
}





std::shared_ptr<RequestGateway::InFlight> RequestGateway::extractInFlight(uint64_t aRequestID)
{
	auto itr = mInFlight.find(aRequestID);
	if (itr == mInFlight.end())
	{
		return nullptr;
	}
	auto res = itr->second;
	mInFlight.erase(itr);
	return res;
}





void RequestGateway::onTransportFinished(uint64_t aRequestID, const std::error_code & aError, const HttpResponse & aResponse)
{
	auto inFlight = extractInFlight(aRequestID);
	if (inFlight == nullptr)
	{
		// Already reported as timed out or cancelled
		return;
	}
	inFlight->mTimeoutTimer.cancel();

	if (aError)
	{
		mErrorBudget.recordOutcome(false, mNow());
		logTransportError(aError, inFlight->mLogErrors);
		return inFlight->mOnFinish(aError, {});
	}

	// The caller will sort through the response instead of us:
	if (!inFlight->mDecodeJson)
	{
		return inFlight->mOnFinish({}, aResponse);
	}

	classifyResponse(*inFlight, aResponse);
}





void RequestGateway::onTimeout(uint64_t aRequestID, const std::error_code & aError)
{
	if (aError)
	{
		// The timer was cancelled, the request has finished in time
		return;
	}
	auto inFlight = extractInFlight(aRequestID);
	if (inFlight == nullptr)
	{
		return;
	}

	// Abort the transport, its completion will be ignored since the request is no longer registered:
	if (inFlight->mRequest != nullptr)
	{
		inFlight->mRequest->cancel();
	}
	mErrorBudget.recordOutcome(false, mNow());
	mLogger->error(fmt::format(
		"{}: Controller API connection terminated because it was taking too long. This error can usually be safely ignored.",
		nvrName()
	));
	inFlight->mOnFinish(Error::Timeout, {});
}





void RequestGateway::classifyResponse(InFlight & aInFlight, const HttpResponse & aResponse)
{
	// Bad username and password:
	if (aResponse.status == 401)
	{
		mErrorBudget.recordOutcome(false, mNow());
		mLogger->error("Invalid login credentials given. Please check your login and password.");
		if (mOnAuthenticationFailure)
		{
			mOnAuthenticationFailure();
		}
		return aInFlight.mOnFinish(Error::AuthenticationFailed, aResponse);
	}

	// Insufficient privileges:
	if (aResponse.status == 403)
	{
		mErrorBudget.recordOutcome(false, mNow());
		mLogger->error("Insufficient privileges for this user. Please check the roles assigned to this user and ensure it has sufficient privileges.");
		return aInFlight.mOnFinish(Error::InsufficientPrivileges, aResponse);
	}

	// Some other unknown error:
	if (!aResponse.isOk())
	{
		mErrorBudget.recordOutcome(false, mNow());
		mLogger->error(fmt::format("API access error: {} - {}", aResponse.status, aResponse.reason));
		return aInFlight.mOnFinish(Error::HttpStatus, aResponse);
	}

	mErrorBudget.recordOutcome(true, mNow());

	// Decode the body; leave the verdict on undecodable bodies to the caller:
	HttpResponse decoded(aResponse);
	decoded.json = nlohmann::json::parse(decoded.body, nullptr, false);
	aInFlight.mOnFinish({}, decoded);
}





void RequestGateway::logTransportError(const std::error_code & aError, bool aLogErrors)
{
	if (aError == asio::error::connection_refused)
	{
		mLogger->error(fmt::format("{}: Controller API connection refused.", nvrName()));
	}
	else if (aError == asio::error::connection_reset)
	{
		mLogger->error(fmt::format("{}: Controller API connection reset.", nvrName()));
	}
	else if ((aError == asio::error::host_not_found) || (aError == asio::error::host_not_found_try_again))
	{
		mLogger->error(fmt::format(
			"{}: Hostname or IP address not found. Please ensure the address you configured for this UniFi Protect controller is correct.",
			nvrName()
		));
	}
	else if (aLogErrors)
	{
		mLogger->error(fmt::format("{}: {}", nvrName(), aError.message()));
	}
}

}  // namespace ProtectClientPp
