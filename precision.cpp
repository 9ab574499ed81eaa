#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

#include "precision.hpp"

using namespace std;

Cents to_cents(double dollars) {
  if (isnan(dollars)) return 0;
  double cents = dollars * kCentsPerDollar;
  if (cents >= static_cast<double>(kCentsLimit)) return kCentsLimit;
  if (cents <= -static_cast<double>(kCentsLimit)) return -kCentsLimit;
  return static_cast<Cents>(llround(cents));
}

double to_dollars(Cents cents) {
  return static_cast<double>(cents) / kCentsPerDollar;
}

string format_cents(Cents cents) {
  // Work on the magnitude as unsigned so INT64_MIN does not overflow.
  uint64_t magnitude = cents < 0 ? 0 - static_cast<uint64_t>(cents)
                                 : static_cast<uint64_t>(cents);
  stringstream ss;
  if (cents < 0) ss << '-';
  ss << magnitude / kCentsPerDollar << '.' << setw(2) << setfill('0')
     << magnitude % kCentsPerDollar;
  return ss.str();
}
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
