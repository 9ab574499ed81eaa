#include "../auction_error.hpp"
#include "../bidder_loader.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

TEST(BidderLoaderTest, ParsesRecords)
{
    std::istringstream in("# id,name,start,max,increment\n"
                          "sasha, Sasha ,50.00,80.00,3.00\n"
                          "\n"
                          "john,John,60,82,2\n");

    std::vector<Bidder> bidders = load_bidders(in, 1000);

    ASSERT_EQ(2, bidders.size());
    EXPECT_EQ("sasha", bidders[0].id());
    EXPECT_EQ("Sasha", bidders[0].name());
    EXPECT_EQ(5000, bidders[0].starting_bid_cents());
    EXPECT_EQ(8000, bidders[0].max_bid_cents());
    EXPECT_EQ(300, bidders[0].auto_increment_cents());
    EXPECT_EQ("john", bidders[1].id());
    EXPECT_EQ(6000, bidders[1].starting_bid_cents());
}

TEST(BidderLoaderTest, FileOrderIsEntryOrder)
{
    std::istringstream in("a,A,1,2,1\nb,B,1,2,1\nc,C,1,2,1\n");

    std::vector<Bidder> bidders = load_bidders(in, 500);

    ASSERT_EQ(3, bidders.size());
    EXPECT_EQ(500, bidders[0].entry_time());
    EXPECT_EQ(501, bidders[1].entry_time());
    EXPECT_EQ(502, bidders[2].entry_time());
}

TEST(BidderLoaderTest, ExplicitEntryTime)
{
    std::istringstream in("a,A,1,2,1,9000\nb,B,1,2,1\n");

    std::vector<Bidder> bidders = load_bidders(in, 500);

    EXPECT_EQ(9000, bidders[0].entry_time());
    EXPECT_EQ(501, bidders[1].entry_time());
}

TEST(BidderLoaderTest, WrongFieldCount)
{
    std::istringstream in("a,A,1,2,1\nb,B,1,2\n");

    try {
        load_bidders(in, 0);
        FAIL() << "Expected AuctionError";
    } catch (const AuctionError& error) {
        EXPECT_EQ(ERROR_VALIDATION, error.type());
        EXPECT_EQ("load_bidders", error.operation());
        EXPECT_EQ("expected 5 or 6 fields, got 4", error.message());
        EXPECT_EQ("2", error.context().at("line"));
        EXPECT_EQ("b,B,1,2", error.context().at("content"));
    }
}

TEST(BidderLoaderTest, BadNumbers)
{
    std::istringstream badAmount("a,A,ten,20,1\n");
    EXPECT_THROW(load_bidders(badAmount, 0), AuctionError);

    std::istringstream notFinite("a,A,1,inf,1\n");
    EXPECT_THROW(load_bidders(notFinite, 0), AuctionError);

    std::istringstream badTime("a,A,1,2,1,soon\n");
    EXPECT_THROW(load_bidders(badTime, 0), AuctionError);
}

TEST(BidderLoaderTest, LoadFromFile)
{
    const std::string path = "test_bidders.csv";
    {
        std::ofstream out(path);
        out << "a,Alice,10,20,1\n";
        out << "b,Bob,12,25,2\n";
    }

    std::vector<Bidder> bidders = load_bidders_from_file(path);
    std::remove(path.c_str());

    ASSERT_EQ(2, bidders.size());
    EXPECT_LT(bidders[0].entry_time(), bidders[1].entry_time());
}

TEST(BidderLoaderTest, MissingFile)
{
    try {
        load_bidders_from_file("does/not/exist.csv");
        FAIL() << "Expected AuctionError";
    } catch (const AuctionError& error) {
        EXPECT_EQ(ERROR_VALIDATION, error.type());
        EXPECT_EQ("does/not/exist.csv", error.context().at("path"));
    }
}
