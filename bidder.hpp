#ifndef __BIDDER_HPP__
#define __BIDDER_HPP__

#include <cstdint>
#include <ostream>
#include <string>

#include "precision.hpp"

// Microseconds since the epoch.
typedef int64_t Timestamp;

Timestamp now_micros();

// A participant in a proxy auction. Identity and bid parameters are fixed at
// construction; only the current bid and the active flag change, and only
// through increment().
class Bidder {
 public:
  Bidder(const std::string& _id, const std::string& _name,
         double starting_bid, double max_bid, double auto_increment,
         Timestamp _entry_time = now_micros());

  // True while active and one more full step stays within the maximum.
  bool can_increment() const;

  // Raise the current bid by one step. Reaching (or passing) the maximum
  // clamps the bid to it and deactivates the bidder.
  bool increment();

  // Fresh copy at the starting bid, same parameters and entry time.
  Bidder restarted() const;

  Cents starting_bid_cents() const { return starting_bid; }
  Cents max_bid_cents() const { return max_bid; }
  Cents auto_increment_cents() const { return auto_increment; }
  Cents current_bid_cents() const { return current_bid; }

  double starting_bid_dollars() const { return to_dollars(starting_bid); }
  double max_bid_dollars() const { return to_dollars(max_bid); }
  double auto_increment_dollars() const { return to_dollars(auto_increment); }
  double current_bid_dollars() const { return to_dollars(current_bid); }

  bool is_active() const { return active; }

  // False when any constructor amount was NaN or infinite. Such amounts are
  // stored clamped (see to_cents) and must be rejected before bidding.
  bool has_finite_amounts() const { return finite_amounts; }

  const std::string& id() const { return bidder_id; }
  const std::string& name() const { return bidder_name; }
  Timestamp entry_time() const { return entered_at; }

 private:
  std::string bidder_id;
  std::string bidder_name;
  Timestamp entered_at;
  Cents starting_bid;
  Cents max_bid;
  Cents auto_increment;
  Cents current_bid;
  bool active;
  bool finite_amounts;
};

std::ostream& operator<<(std::ostream& o, const Bidder& bidder);

#endif  // __BIDDER_HPP__
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
