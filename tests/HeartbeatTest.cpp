#include <gtest/gtest.h>
#include "Heartbeat.hpp"





using namespace ProtectClientPp;
using namespace std::chrono;





static const Clock::time_point T0 = Clock::time_point() + hours(1);





TEST(HeartbeatTest, IdleTimerDoesNothing)
{
	Heartbeat hb(seconds(10));
	EXPECT_FALSE(hb.isArmed());
	EXPECT_EQ(hb.onTimer(T0), HeartbeatAction::None);
}





TEST(HeartbeatTest, TrafficPushesDeadline)
{
	Heartbeat hb(seconds(10));
	EXPECT_EQ(hb.onEvent(SocketEvent::Opened, T0), HeartbeatAction::Rearm);
	EXPECT_EQ(hb.deadline(), T0 + seconds(10));
	EXPECT_EQ(hb.onEvent(SocketEvent::Frame, T0 + seconds(4)), HeartbeatAction::Rearm);
	EXPECT_EQ(hb.deadline(), T0 + seconds(14));
	EXPECT_EQ(hb.onEvent(SocketEvent::Ping, T0 + seconds(9)), HeartbeatAction::Rearm);
	EXPECT_EQ(hb.deadline(), T0 + seconds(19));

	// A timer armed for the original deadline fires early:
	EXPECT_EQ(hb.onTimer(T0 + seconds(10)), HeartbeatAction::Rearm);
	EXPECT_TRUE(hb.isArmed());
}





TEST(HeartbeatTest, SilenceTearsDown)
{
	Heartbeat hb(seconds(10));
	hb.onEvent(SocketEvent::Opened, T0);
	EXPECT_EQ(hb.onTimer(T0 + seconds(10)), HeartbeatAction::Teardown);
	EXPECT_FALSE(hb.isArmed());
	EXPECT_EQ(hb.onTimer(T0 + seconds(20)), HeartbeatAction::None);
}





TEST(HeartbeatTest, CloseCancelsAndFailureTearsDown)
{
	Heartbeat hb(seconds(10));
	hb.onEvent(SocketEvent::Opened, T0);
	EXPECT_EQ(hb.onEvent(SocketEvent::Closed, T0 + seconds(1)), HeartbeatAction::Cancel);
	EXPECT_EQ(hb.onTimer(T0 + seconds(30)), HeartbeatAction::None);

	hb.onEvent(SocketEvent::Opened, T0);
	EXPECT_EQ(hb.onEvent(SocketEvent::Failed, T0 + seconds(1)), HeartbeatAction::Teardown);
	EXPECT_FALSE(hb.isArmed());
}
