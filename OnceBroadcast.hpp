#pragma once

#include <functional>
#include <vector>





namespace ProtectClientPp
{





/** A single-producer, multiple-waiter outcome cell.
The first waiter to arrive while the cell is idle is expected to start the operation (wait() returns true for it);
any further waiters just get queued. Once the producer calls settle(), all the queued waiters are called with the
outcome, and the cell becomes idle again, ready for another round.
Not thread-safe, designed to be used from a single io_context thread. */
template <typename Outcome>
class OnceBroadcast
{
public:

	using Waiter = std::function<void(const Outcome &)>;


	OnceBroadcast():
		mIsPending(false)
	{
	}

	/** Queues the waiter for the outcome.
	Returns true if this is the first waiter and the caller should start the operation producing the outcome. */
	bool wait(Waiter aWaiter)
	{
		mWaiters.push_back(std::move(aWaiter));
		if (mIsPending)
		{
			return false;
		}
		mIsPending = true;
		return true;
	}

	/** Delivers the outcome to all queued waiters.
	The cell is marked idle before any of the waiters is called, so that a waiter may start a new round. */
	void settle(const Outcome & aOutcome)
	{
		decltype(mWaiters) waiters;
		std::swap(waiters, mWaiters);
		mIsPending = false;
		for (const auto & w: waiters)
		{
			w(aOutcome);
		}
	}

	/** Returns true if an operation is in progress. */
	bool isPending() const { return mIsPending; }

	/** Returns the number of waiters currently queued. */
	size_t numWaiters() const { return mWaiters.size(); }


protected:

	bool mIsPending;

	std::vector<Waiter> mWaiters;
};

}  // namespace ProtectClientPp
