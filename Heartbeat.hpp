#pragma once

#include "ClientConfig.hpp"
#include "RealtimeSocket.hpp"





namespace ProtectClientPp
{





/** What the EventChannel should do in response to a socket event or a timer expiry. */
enum class HeartbeatAction
{
	None,      // Nothing to do
	Rearm,     // (Re)start the liveness timer to fire at deadline()
	Cancel,    // Stop the liveness timer
	Teardown,  // Terminate the connection and clear its handle
};





/** The liveness supervision of the realtime connection, as a plain state machine.
Any inbound traffic (the open event, a data frame or a protocol ping) pushes the deadline out by the heartbeat
interval; if the deadline passes without any traffic, the connection is considered dead. */
class Heartbeat
{
public:

	explicit Heartbeat(Clock::duration aInterval);

	/** Processes a socket event received at aNow. */
	HeartbeatAction onEvent(SocketEvent aEvent, Clock::time_point aNow);

	/** Processes the liveness timer firing at aNow.
	Returns Teardown if the deadline has passed, Rearm if the timer fired early (the deadline was moved in the
	meantime), None if the supervision is not active. */
	HeartbeatAction onTimer(Clock::time_point aNow);

	/** Stops the supervision (used when the connection is torn down by other means). */
	void reset() { mIsArmed = false; }

	bool isArmed() const { return mIsArmed; }
	Clock::time_point deadline() const { return mDeadline; }
	Clock::duration interval() const { return mInterval; }


protected:

	Clock::duration mInterval;
	bool mIsArmed;
	Clock::time_point mDeadline;
};

}  // namespace ProtectClientPp
