#ifndef __BID_VALIDATOR_HPP__
#define __BID_VALIDATOR_HPP__

#include <vector>

#include "bidder.hpp"

// Rejects bidders the engine must never see. Implementations throw
// AuctionError (ERROR_VALIDATION) listing every problem found.
class BidValidator {
 public:
  virtual ~BidValidator() {}
  virtual void validate_bidder(const Bidder& bidder) const = 0;
  virtual void validate_bidders(const std::vector<Bidder>& bidders) const = 0;
};

class DefaultBidValidator : public BidValidator {
 public:
  // Required id and name, non-negative bids, a positive step and
  // starting <= maximum.
  virtual void validate_bidder(const Bidder& bidder) const;

  // At least one bidder, unique ids, and every bidder valid on its own.
  virtual void validate_bidders(const std::vector<Bidder>& bidders) const;
};

#endif  // __BID_VALIDATOR_HPP__
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
