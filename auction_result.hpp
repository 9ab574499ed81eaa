#ifndef __AUCTION_RESULT_HPP__
#define __AUCTION_RESULT_HPP__

#include <string>
#include <vector>

#include "bidder.hpp"
#include "precision.hpp"

// Outcome of one engine run. Built once and read-only afterwards.
class AuctionResult {
 public:
  // No bidders, no winner.
  AuctionResult();

  // _winner_index must be a valid position in final_bidders.
  AuctionResult(int _winner_index, Cents _winning_bid,
                int _total_bidders, int _bidding_rounds,
                const std::vector<Bidder>& final_bidders);

  // Points into all_bidders(); nullptr when nobody took part.
  const Bidder* winner() const;
  bool has_winner() const { return winner_index >= 0; }

  Cents winning_bid_cents() const { return winning_bid; }
  double winning_bid_dollars() const { return to_dollars(winning_bid); }
  int total_bidders() const { return total; }
  int bidding_rounds() const { return rounds; }

  // Final state of every bidder, in entry-time order.
  const std::vector<Bidder>& all_bidders() const { return bidders; }

 private:
  std::vector<Bidder> bidders;
  int winner_index;
  Cents winning_bid;
  int total;
  int rounds;
};

#endif  // __AUCTION_RESULT_HPP__
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
