#include "ErrorBudget.hpp"





namespace ProtectClientPp
{





ErrorBudget::ErrorBudget(unsigned aErrorLimit, Clock::duration aRetryInterval):
	mErrorLimit(aErrorLimit),
	mRetryInterval(aRetryInterval),
	mConsecutiveErrors(0),
	mLastSuccessAt(),
	mIsThrottling(false)
{
}





void ErrorBudget::recordOutcome(bool aSuccess, Clock::time_point aNow)
{
	if (aSuccess)
	{
		mConsecutiveErrors = 0;
		mLastSuccessAt = aNow;
		mIsThrottling = false;
	}
	else
	{
		mConsecutiveErrors += 1;
	}
}





ThrottleDecision ErrorBudget::shouldThrottle(Clock::time_point aNow)
{
	if (mConsecutiveErrors < mErrorLimit)
	{
		return ThrottleDecision::Proceed;
	}

	// Just reached (or overshot) the limit, start throttling from now on:
	if (!mIsThrottling)
	{
		mIsThrottling = true;
		mConsecutiveErrors += 1;
		mLastSuccessAt = aNow;
		return ThrottleDecision::ThrottleStarted;
	}

	if (aNow <= mLastSuccessAt + mRetryInterval)
	{
		return ThrottleDecision::Throttled;
	}

	// Out of the penalty box:
	mIsThrottling = false;
	mConsecutiveErrors = 0;
	return ThrottleDecision::Resumed;
}

}  // namespace ProtectClientPp
