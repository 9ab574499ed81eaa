#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "auction_error.hpp"
#include "auction_result.hpp"
#include "bidder.hpp"
#include "bidding_engine.hpp"
#include "precision.hpp"
#include "shared.hpp"

using namespace std;

static bool validate_max_rounds(const char* flagname, int32_t value) {
  if (value > 0) return true;
  LOG(ERROR) << "--" << flagname << " must be positive, got " << value;
  return false;
}

DEFINE_int32(max_rounds, 1000,
    "Number of bidding rounds after which an auction is abandoned.");
DEFINE_validator(max_rounds, &validate_max_rounds);

static AuctionError negative_bid_error(const char* operation,
                                       const Bidder& bidder) {
  AuctionError error(ERROR_INTERNAL, "bidder has negative current bid");
  error.with_operation(operation)
      .add_context("bidder_id", bidder.id())
      .add_context("current_bid_cents", to_string(bidder.current_bid_cents()))
      .add_context("current_bid", format_cents(bidder.current_bid_cents()));
  return error;
}

BiddingEngine::BiddingEngine() : max_rounds_(FLAGS_max_rounds) {}

BiddingEngine::BiddingEngine(int _max_rounds) : max_rounds_(_max_rounds) {
  CHECK_GT(max_rounds_, 0) << "Round cap must be positive";
}

AuctionResult BiddingEngine::process_bids(const vector<Bidder>& bidders) const {
  if (bidders.empty()) {
    VLOG(1) << "No bidders, nothing to resolve.";
    return AuctionResult();
  }

  // Work on fresh copies so the caller keeps the pre-auction state.
  vector<Bidder> working;
  working.reserve(bidders.size());
  for (const Bidder& bidder : bidders) {
    working.push_back(bidder.restarted());
  }
  stable_sort(working.begin(), working.end(),
              [](const Bidder& first, const Bidder& second) {
    return first.entry_time() < second.entry_time();
  });

  if (VLOG_IS_ON(1)) {
    VLOG(1) << "Starting auction with " << working.size() << " bidders, "
            << max_rounds_ << " max rounds.";
    for (const Bidder& bidder : working) {
      VLOG(1) << "  " << bidder;
    }
  }

  int rounds = 0;
  while (rounds < max_rounds_) {
    bool incremented;
    try {
      incremented = increment_bids(working);
    } catch (AuctionError& error) {
      error.add_context("round", to_string(rounds))
          .add_context("max_rounds", to_string(max_rounds_));
      throw;
    }
    if (!incremented) break;
    ++rounds;
    VLOG(1) << "Round " << rounds << ": high bid "
            << format_cents(highest_bid(working));
  }

  if (rounds >= max_rounds_) {
    LOG(WARNING) << "Auction with " << working.size()
                 << " bidders did not settle within " << max_rounds_
                 << " rounds";
    AuctionError error(ERROR_TIMEOUT, "bidding exceeded maximum rounds");
    error.with_operation("process_bids")
        .add_context("max_rounds", to_string(max_rounds_))
        .add_context("final_round", to_string(rounds))
        .add_context("bidder_count", to_string(working.size()));
    throw error;
  }

  const Bidder* winner = find_winner(working);
  Cents price = minimum_winning_bid(working, *winner);

  VLOG(1) << "Settled after " << rounds << " rounds: " << winner->id()
          << " wins at " << format_cents(price)
          << " (current bid " << format_cents(winner->current_bid_cents())
          << ")";

  // Ids are not required to be unique here; hand over the position.
  return AuctionResult(static_cast<int>(winner - &working[0]), price,
                       static_cast<int>(bidders.size()), rounds, working);
}

bool BiddingEngine::increment_bids(vector<Bidder>& bidders) const {
  if (bidders.size() <= 1) return false;

  // Compare against the high bid as it stood when the round began. Bidders
  // that catch up during this round are looked at again next round.
  const Cents high = highest_bid(bidders);

  vector<string> raised;
  for (Bidder& bidder : bidders) {
    if (bidder.current_bid_cents() >= high || !bidder.can_increment()) {
      continue;
    }

    if (!bidder.increment()) {
      LOG(ERROR) << "Increment refused after can_increment(): " << bidder;
      AuctionError error(ERROR_INTERNAL,
          "bidder increment failed despite can_increment()");
      error.with_operation("increment_bids")
          .add_context("bidder_id", bidder.id())
          .add_context("current_bid", format_cents(bidder.current_bid_cents()))
          .add_context("max_bid", format_cents(bidder.max_bid_cents()))
          .add_context("auto_increment",
                       format_cents(bidder.auto_increment_cents()));
      throw error;
    }
    raised.push_back(bidder.id());
    VLOG(2) << "    Incremented " << bidder << " chasing "
            << format_cents(high);
  }

  if (!raised.empty()) {
    VLOG(1) << "  Chasing " << format_cents(high) << ": raised ["
            << join(raised, ", ") << "]";
  }
  return !raised.empty();
}

Cents BiddingEngine::highest_bid(const vector<Bidder>& bidders) const {
  Cents high = 0;
  for (int i = 0; i < bidders.size(); ++i) {
    const Bidder& bidder = bidders[i];
    if (bidder.current_bid_cents() < 0) {
      LOG(ERROR) << "Negative current bid: " << bidder;
      throw negative_bid_error("highest_bid", bidder);
    }
    if (i == 0 || bidder.current_bid_cents() > high) {
      high = bidder.current_bid_cents();
    }
  }
  return high;
}

const Bidder* BiddingEngine::find_winner(const vector<Bidder>& bidders) const {
  const Bidder* winner = nullptr;
  for (const Bidder& bidder : bidders) {
    if (bidder.current_bid_cents() < 0) {
      LOG(ERROR) << "Negative current bid: " << bidder;
      throw negative_bid_error("find_winner", bidder);
    }
    // Strictly greater: on a tie the earlier entry keeps the lead.
    if (winner == nullptr ||
        bidder.current_bid_cents() > winner->current_bid_cents()) {
      winner = &bidder;
    }
  }
  return winner;
}

Cents BiddingEngine::minimum_winning_bid(const vector<Bidder>& bidders,
                                         const Bidder& winner) const {
  // Prefer the exact element; fall back to the first bidder with its id.
  int winner_index = -1;
  for (int i = 0; i < bidders.size(); ++i) {
    if (&bidders[i] == &winner) {
      winner_index = i;
      break;
    }
  }
  for (int i = 0; winner_index < 0 && i < bidders.size(); ++i) {
    if (bidders[i].id() == winner.id()) winner_index = i;
  }
  if (winner_index < 0) {
    LOG(ERROR) << "Winner " << winner.id() << " is not among "
               << bidders.size() << " bidders";
    AuctionError error(ERROR_INTERNAL, "winner not found among bidders");
    error.with_operation("minimum_winning_bid")
        .add_context("winner_id", winner.id())
        .add_context("bidder_count", to_string(bidders.size()));
    throw error;
  }

  // The best the competition could ever have offered.
  const Bidder* runner_up = nullptr;
  for (int i = 0; i < bidders.size(); ++i) {
    if (i == winner_index) continue;
    const Bidder& bidder = bidders[i];
    if (runner_up == nullptr ||
        bidder.max_bid_cents() > runner_up->max_bid_cents()) {
      runner_up = &bidder;
    }
  }

  if (runner_up == nullptr) {
    return winner.starting_bid_cents();
  }

  Cents price = runner_up->max_bid_cents() + winner.auto_increment_cents();
  price = min(price, winner.max_bid_cents());
  price = max(price, winner.starting_bid_cents());

  if (price < 0) {
    LOG(ERROR) << "Negative winning price " << price << " for " << winner;
    AuctionError error(ERROR_INTERNAL,
                       "calculated minimum winning bid is negative");
    error.with_operation("minimum_winning_bid")
        .add_context("winner_id", winner.id())
        .add_context("calculated_bid_cents", to_string(price))
        .add_context("runner_up_id", runner_up->id())
        .add_context("runner_up_max_cents",
                     to_string(runner_up->max_bid_cents()));
    throw error;
  }
  return price;
}
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
