#include <string>
#include <vector>

#include "auction_error.hpp"
#include "auction_result.hpp"

using namespace std;

AuctionResult::AuctionResult()
    : winner_index(-1), winning_bid(0), total(0), rounds(0) {}

AuctionResult::AuctionResult(int _winner_index, Cents _winning_bid,
                             int _total_bidders, int _bidding_rounds,
                             const vector<Bidder>& final_bidders)
    : bidders(final_bidders),
      winner_index(_winner_index),
      winning_bid(_winning_bid),
      total(_total_bidders),
      rounds(_bidding_rounds) {
  if (winner_index < 0 || winner_index >= static_cast<int>(bidders.size())) {
    AuctionError error(ERROR_INTERNAL, "winner index outside final bidders");
    error.with_operation("AuctionResult")
        .add_context("winner_index", to_string(winner_index))
        .add_context("bidder_count", to_string(bidders.size()));
    throw error;
  }
}

const Bidder* AuctionResult::winner() const {
  if (winner_index < 0) return nullptr;
  return &bidders[winner_index];
}
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
