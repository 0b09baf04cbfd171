#include <gtest/gtest.h>
#include <system_error>
#include "OnceBroadcast.hpp"





using namespace ProtectClientPp;





TEST(OnceBroadcastTest, OnlyFirstWaiterStarts)
{
	OnceBroadcast<int> cell;
	std::vector<int> received;
	EXPECT_TRUE(cell.wait([&](const int & aValue) { received.push_back(aValue); }));
	EXPECT_FALSE(cell.wait([&](const int & aValue) { received.push_back(aValue + 100); }));
	EXPECT_FALSE(cell.wait([&](const int & aValue) { received.push_back(aValue + 200); }));
	EXPECT_TRUE(cell.isPending());
	EXPECT_EQ(cell.numWaiters(), 3u);

	cell.settle(1);
	EXPECT_EQ(received, (std::vector<int>{1, 101, 201}));
	EXPECT_FALSE(cell.isPending());
	EXPECT_EQ(cell.numWaiters(), 0u);
}





TEST(OnceBroadcastTest, IdleBeforeWaitersAreCalled)
{
	OnceBroadcast<std::error_code> cell;
	bool wasPending = true;
	bool startedNewRound = false;
	cell.wait([&](const std::error_code &)
		{
			wasPending = cell.isPending();

			// A waiter may immediately start another round; it isn't part of the current one:
			startedNewRound = cell.wait([](const std::error_code &) {});
		}
	);
	cell.settle(std::make_error_code(std::errc::timed_out));
	EXPECT_FALSE(wasPending);
	EXPECT_TRUE(startedNewRound);
	EXPECT_TRUE(cell.isPending());
	EXPECT_EQ(cell.numWaiters(), 1u);
}
