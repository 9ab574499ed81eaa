#ifndef __BIDDING_ENGINE_HPP__
#define __BIDDING_ENGINE_HPP__

#include <vector>

#include <gflags/gflags.h>

#include "auction_result.hpp"
#include "bidder.hpp"
#include "precision.hpp"

DECLARE_int32(max_rounds);

// Anything that can turn a bidder list into a result.
class BidProcessor {
 public:
  virtual ~BidProcessor() {}
  virtual AuctionResult process_bids(
      const std::vector<Bidder>& bidders) const = 0;
};

class BiddingEngine : public BidProcessor {
 public:
  // Round cap taken from --max_rounds.
  BiddingEngine();
  explicit BiddingEngine(int _max_rounds);

  // Runs the whole auction on a private copy of the bidders. Throws
  // AuctionError (ERROR_TIMEOUT or ERROR_INTERNAL); never returns a partial
  // result.
  virtual AuctionResult process_bids(const std::vector<Bidder>& bidders) const;

  // One round: every bidder below the round-start high bid that can still
  // step up does so once. Returns whether anybody moved.
  bool increment_bids(std::vector<Bidder>& bidders) const;

  Cents highest_bid(const std::vector<Bidder>& bidders) const;

  // Highest current bid; the first one in the list wins a tie, so the list is
  // expected in entry-time order. nullptr for an empty list.
  const Bidder* find_winner(const std::vector<Bidder>& bidders) const;

  // What the winner actually pays: one step over the best competing maximum,
  // kept within the winner's own starting and maximum bid. The winner is
  // matched by address when it is an element of bidders, otherwise by id.
  Cents minimum_winning_bid(const std::vector<Bidder>& bidders,
                            const Bidder& winner) const;

  int max_rounds() const { return max_rounds_; }

 private:
  const int max_rounds_;
};

#endif  // __BIDDING_ENGINE_HPP__
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
