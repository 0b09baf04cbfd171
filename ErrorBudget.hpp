#pragma once

#include "ClientConfig.hpp"





namespace ProtectClientPp
{





/** The decision of ErrorBudget::shouldThrottle() about the request about to be made. */
enum class ThrottleDecision
{
	Proceed,          // Normal operation, send the request
	ThrottleStarted,  // The error limit was just reached; don't send, throttling starts now
	Throttled,        // Still within the retry interval; don't send
	Resumed,          // The retry interval has passed; the counter was reset, send the request
};





/** Tracks consecutive request failures and decides when to stop hammering the NVR.
Once apiErrorLimit failures accumulate, the next request starts a throttling period of apiRetryInterval during which
no requests are sent at all.
Note that the throttling period is measured from the moment the limit was first detected (the next request after
crossing it), not from the last actual attempt: shouldThrottle() re-stamps mLastSuccessAt at that moment.
This is intentional, the retry cadence is kept the same as it has always been. */
class ErrorBudget
{
public:

	ErrorBudget(unsigned aErrorLimit, Clock::duration aRetryInterval);

	/** Records the outcome of a single request.
	Success resets the error counter and remembers the time; failure increments the counter. */
	void recordOutcome(bool aSuccess, Clock::time_point aNow);

	/** Decides whether a request made at aNow should be suppressed.
	Updates the internal state accordingly (see ThrottleDecision). */
	ThrottleDecision shouldThrottle(Clock::time_point aNow);

	unsigned consecutiveErrors() const { return mConsecutiveErrors; }
	bool isThrottling() const { return mIsThrottling; }
	Clock::time_point lastSuccessAt() const { return mLastSuccessAt; }
	unsigned errorLimit() const { return mErrorLimit; }
	Clock::duration retryInterval() const { return mRetryInterval; }


protected:

	unsigned mErrorLimit;
	Clock::duration mRetryInterval;

	/** Number of failed requests since the last successful one. */
	unsigned mConsecutiveErrors;

	/** Time of the last successful request, or of the start of the current throttling period. */
	Clock::time_point mLastSuccessAt;

	/** Set while a throttling period is in progress.
	Several requests may fail while in flight, so the counter can overshoot the limit before the period starts. */
	bool mIsThrottling;
};

}  // namespace ProtectClientPp
