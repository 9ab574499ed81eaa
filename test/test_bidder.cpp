#include "../bidder.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <sstream>

TEST(BidderTest, Construction)
{
    Bidder bidder("1", "Alice", 10.00, 20.00, 2.50, 1000);

    EXPECT_EQ("1", bidder.id());
    EXPECT_EQ("Alice", bidder.name());
    EXPECT_EQ(1000, bidder.entry_time());
    EXPECT_EQ(1000, bidder.starting_bid_cents());
    EXPECT_EQ(2000, bidder.max_bid_cents());
    EXPECT_EQ(250, bidder.auto_increment_cents());
    EXPECT_EQ(1000, bidder.current_bid_cents());
    EXPECT_DOUBLE_EQ(10.00, bidder.current_bid_dollars());
    EXPECT_TRUE(bidder.is_active());
}

TEST(BidderTest, DefaultEntryTimeIsNow)
{
    Timestamp before = now_micros();
    Bidder bidder("1", "Alice", 10.00, 20.00, 1.00);
    Timestamp after = now_micros();

    EXPECT_GE(bidder.entry_time(), before);
    EXPECT_LE(bidder.entry_time(), after);
}

TEST(BidderTest, CanIncrement)
{
    EXPECT_TRUE(Bidder("1", "A", 10.00, 20.00, 5.00, 0).can_increment());
    // Exactly reaching the maximum is allowed.
    EXPECT_TRUE(Bidder("1", "A", 15.00, 20.00, 5.00, 0).can_increment());
    // One step would overshoot.
    EXPECT_FALSE(Bidder("1", "A", 18.00, 20.00, 5.00, 0).can_increment());
    EXPECT_FALSE(Bidder("1", "A", 20.00, 20.00, 1.00, 0).can_increment());
}

TEST(BidderTest, Increment)
{
    Bidder bidder("1", "Alice", 10.00, 20.00, 5.00, 0);

    EXPECT_TRUE(bidder.increment());
    EXPECT_EQ(1500, bidder.current_bid_cents());
    EXPECT_TRUE(bidder.is_active());

    // Reaching the maximum deactivates
    EXPECT_TRUE(bidder.increment());
    EXPECT_EQ(2000, bidder.current_bid_cents());
    EXPECT_FALSE(bidder.is_active());

    // No further change
    EXPECT_FALSE(bidder.increment());
    EXPECT_EQ(2000, bidder.current_bid_cents());
}

TEST(BidderTest, IncrementRefusedWhenStepOvershoots)
{
    Bidder bidder("1", "Alice", 10.00, 12.00, 5.00, 0);

    EXPECT_FALSE(bidder.can_increment());
    EXPECT_FALSE(bidder.increment());
    EXPECT_EQ(1000, bidder.current_bid_cents());
    EXPECT_TRUE(bidder.is_active());
}

TEST(BidderTest, RepeatedIncrementsDoNotDrift)
{
    // 0.10 is not representable in binary floating point; cents are.
    Bidder bidder("1", "Alice", 0.00, 1000.00, 0.10, 0);

    int steps = 0;
    while (bidder.increment()) {
        ++steps;
        EXPECT_EQ(steps * 10, bidder.current_bid_cents());
    }
    EXPECT_EQ(10000, steps);
    EXPECT_EQ(100000, bidder.current_bid_cents());
    EXPECT_DOUBLE_EQ(1000.00, bidder.current_bid_dollars());
    EXPECT_FALSE(bidder.is_active());
}

TEST(BidderTest, BidStaysWithinBounds)
{
    Bidder bidder("1", "Alice", 3.33, 17.77, 1.11, 0);

    Cents previous = bidder.current_bid_cents();
    while (bidder.increment()) {
        EXPECT_GT(bidder.current_bid_cents(), previous);
        EXPECT_GE(bidder.current_bid_cents(), bidder.starting_bid_cents());
        EXPECT_LE(bidder.current_bid_cents(), bidder.max_bid_cents());
        previous = bidder.current_bid_cents();
    }
}

TEST(BidderTest, Restarted)
{
    Bidder bidder("1", "Alice", 10.00, 20.00, 5.00, 4242);
    bidder.increment();
    bidder.increment();
    ASSERT_FALSE(bidder.is_active());

    Bidder fresh = bidder.restarted();
    EXPECT_EQ("1", fresh.id());
    EXPECT_EQ("Alice", fresh.name());
    EXPECT_EQ(4242, fresh.entry_time());
    EXPECT_EQ(1000, fresh.current_bid_cents());
    EXPECT_EQ(2000, fresh.max_bid_cents());
    EXPECT_EQ(500, fresh.auto_increment_cents());
    EXPECT_TRUE(fresh.is_active());

    // The original is untouched
    EXPECT_EQ(2000, bidder.current_bid_cents());
}

TEST(BidderTest, FiniteAmounts)
{
    EXPECT_TRUE(Bidder("1", "Alice", 10.00, 20.00, 1.00, 0).has_finite_amounts());
    EXPECT_FALSE(Bidder("1", "Alice", std::numeric_limits<double>::quiet_NaN(), 20.00, 1.00, 0).has_finite_amounts());
    EXPECT_FALSE(Bidder("1", "Alice", 10.00, 20.00, std::numeric_limits<double>::infinity(), 0).has_finite_amounts());
    // The flag survives a restart
    EXPECT_FALSE(Bidder("1", "Alice", 10.00, std::numeric_limits<double>::infinity(), 1.00, 0).restarted().has_finite_amounts());
}

TEST(BidderTest, StreamOutput)
{
    std::stringstream ss;
    ss << Bidder("bob", "Bob", 1.50, 2.00, 0.25, 7);
    EXPECT_EQ("{id=bob, cur=1.50, start=1.50, max=2.00, inc=0.25, active=1, t=7}", ss.str());
}
