#include "Heartbeat.hpp"





namespace ProtectClientPp
{





Heartbeat::Heartbeat(Clock::duration aInterval):
	mInterval(aInterval),
	mIsArmed(false),
	mDeadline()
{
}





HeartbeatAction Heartbeat::onEvent(SocketEvent aEvent, Clock::time_point aNow)
{
	switch (aEvent)
	{
		case SocketEvent::Opened:
		case SocketEvent::Frame:
		case SocketEvent::Ping:
		{
			mIsArmed = true;
			mDeadline = aNow + mInterval;
			return HeartbeatAction::Rearm;
		}
		case SocketEvent::Closed:
		{
			mIsArmed = false;
			return HeartbeatAction::Cancel;
		}
		case SocketEvent::Failed:
		{
			mIsArmed = false;
			return HeartbeatAction::Teardown;
		}
	}
	return HeartbeatAction::None;
}





HeartbeatAction Heartbeat::onTimer(Clock::time_point aNow)
{
	if (!mIsArmed)
	{
		return HeartbeatAction::None;
	}
	if (aNow < mDeadline)
	{
		return HeartbeatAction::Rearm;
	}
	mIsArmed = false;
	return HeartbeatAction::Teardown;
}

}  // namespace ProtectClientPp
