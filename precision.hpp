#ifndef __PRECISION_HPP__
#define __PRECISION_HPP__

#include <cstdint>
#include <string>

// Amounts are kept in cents. Dollar values only exist at the edges.
typedef int64_t Cents;

const Cents kCentsPerDollar = 100;

// Largest amount a bidder may state: one trillion dollars. Sums of two
// accepted amounts stay far inside the int64 range.
const Cents kMaxAmountCents = 100000000000000LL;

// to_cents never returns a magnitude above this.
const Cents kCentsLimit = 1000000000000000000LL;

// Round to the nearest cent, halves away from zero (0.005 -> 1, -0.005 -> -1).
// Values beyond +/-kCentsLimit (infinities included) clamp to it; NaN maps
// to 0.
Cents to_cents(double dollars);

double to_dollars(Cents cents);

// "12.34", "-0.05". Formatted from the integer value, no floating point.
std::string format_cents(Cents cents);

#endif  // __PRECISION_HPP__
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
