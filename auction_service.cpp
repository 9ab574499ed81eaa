#include <exception>
#include <string>
#include <vector>

#include <glog/logging.h>

#include "auction_error.hpp"
#include "auction_result.hpp"
#include "auction_service.hpp"
#include "bidder.hpp"

using namespace std;

static void tag(AuctionError& error, const string& step) {
  error.with_operation("DetermineWinner." + step)
      .add_context("service", "AuctionService");
}

AuctionService::AuctionService()
    : validator(&default_validator), processor(&default_engine) {}

AuctionService::AuctionService(const BidValidator& _validator,
                               const BidProcessor& _processor)
    : validator(&_validator), processor(&_processor) {}

AuctionResult AuctionService::determine_winner(
    const vector<Bidder>& bidders) const {
  try {
    validator->validate_bidders(bidders);
  } catch (AuctionError& error) {
    tag(error, "Validation");
    throw;
  } catch (const exception& e) {
    AuctionError error(ERROR_VALIDATION, "unexpected validation error");
    error.add_context("cause", e.what());
    tag(error, "Validation");
    throw error;
  }

  try {
    AuctionResult result = processor->process_bids(bidders);
    VLOG(1) << "Auction of " << bidders.size() << " bidders resolved in "
            << result.bidding_rounds() << " rounds";
    return result;
  } catch (AuctionError& error) {
    LOG(WARNING) << "Processing failed: " << error.what();
    tag(error, "Processing");
    throw;
  } catch (const exception& e) {
    AuctionError error(ERROR_INTERNAL, "unexpected processing error");
    error.add_context("cause", e.what())
        .add_context("bidder_count", to_string(bidders.size()));
    tag(error, "Processing");
    throw error;
  }
}
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
