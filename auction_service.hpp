#ifndef __AUCTION_SERVICE_HPP__
#define __AUCTION_SERVICE_HPP__

#include <vector>

#include "auction_result.hpp"
#include "bid_validator.hpp"
#include "bidder.hpp"
#include "bidding_engine.hpp"

// Validate, then resolve. Errors from either step come back as AuctionError
// tagged with the step that raised them.
class AuctionService {
 public:
  AuctionService();
  // Borrows both collaborators; they must outlive the service.
  AuctionService(const BidValidator& _validator,
                 const BidProcessor& _processor);

  AuctionResult determine_winner(const std::vector<Bidder>& bidders) const;

 private:
  AuctionService(const AuctionService&);
  AuctionService& operator=(const AuctionService&);

  DefaultBidValidator default_validator;
  BiddingEngine default_engine;

  const BidValidator* validator;
  const BidProcessor* processor;
};

#endif  // __AUCTION_SERVICE_HPP__
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
