#include <chrono>
#include <cmath>
#include <ostream>
#include <string>

#include "bidder.hpp"
#include "precision.hpp"

using namespace std;

Timestamp now_micros() {
  return chrono::duration_cast<chrono::microseconds>(
      chrono::system_clock::now().time_since_epoch()).count();
}

Bidder::Bidder(const string& _id, const string& _name, double _starting_bid,
               double _max_bid, double _auto_increment, Timestamp _entry_time)
    : bidder_id(_id),
      bidder_name(_name),
      entered_at(_entry_time),
      starting_bid(to_cents(_starting_bid)),
      max_bid(to_cents(_max_bid)),
      auto_increment(to_cents(_auto_increment)),
      current_bid(starting_bid),
      active(true),
      finite_amounts(isfinite(_starting_bid) && isfinite(_max_bid) &&
                     isfinite(_auto_increment)) {}

bool Bidder::can_increment() const {
  return active && current_bid + auto_increment <= max_bid;
}

bool Bidder::increment() {
  if (!can_increment()) return false;

  current_bid += auto_increment;
  if (current_bid >= max_bid) {
    current_bid = max_bid;
    active = false;
  }
  return true;
}

Bidder Bidder::restarted() const {
  Bidder fresh(*this);
  fresh.current_bid = starting_bid;
  fresh.active = true;
  return fresh;
}

ostream& operator<<(ostream& o, const Bidder& bidder) {
  o << "{id=" << bidder.id()
    << ", cur=" << format_cents(bidder.current_bid_cents())
    << ", start=" << format_cents(bidder.starting_bid_cents())
    << ", max=" << format_cents(bidder.max_bid_cents())
    << ", inc=" << format_cents(bidder.auto_increment_cents())
    << ", active=" << bidder.is_active()
    << ", t=" << bidder.entry_time()
    << "}";
  return o;
}
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
