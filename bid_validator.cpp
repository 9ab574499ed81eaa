#include <set>
#include <string>
#include <unordered_set>
#include <vector>

#include <glog/logging.h>

#include "auction_error.hpp"
#include "bid_validator.hpp"
#include "bidder.hpp"
#include "precision.hpp"
#include "shared.hpp"

using namespace std;

static void check_ceiling(const Bidder& bidder, const char* field,
                          const char* label, Cents amount,
                          vector<ValidationIssue>* issues) {
  if (amount <= kMaxAmountCents) return;
  issues->push_back(ValidationIssue(
      bidder.id(), field,
      string(label) + " exceeds the limit of " + format_cents(kMaxAmountCents),
      format_cents(amount)));
}

static vector<ValidationIssue> check_bidder(const Bidder& bidder) {
  vector<ValidationIssue> issues;

  if (trim(bidder.id()).empty()) {
    issues.push_back(ValidationIssue(
        "", "id", "bidder id is required", bidder.id()));
  }
  if (trim(bidder.name()).empty()) {
    issues.push_back(ValidationIssue(
        bidder.id(), "name", "bidder name is required", bidder.name()));
  }
  if (!bidder.has_finite_amounts()) {
    // Stored cents are clamped stand-ins; skip the range checks.
    issues.push_back(ValidationIssue(
        bidder.id(), "amount", "bid amounts must be finite numbers",
        "starting: " + format_cents(bidder.starting_bid_cents()) +
            ", max: " + format_cents(bidder.max_bid_cents()) +
            ", increment: " + format_cents(bidder.auto_increment_cents())));
    return issues;
  }
  if (bidder.starting_bid_cents() < 0) {
    issues.push_back(ValidationIssue(
        bidder.id(), "starting_bid", "starting bid cannot be negative",
        format_cents(bidder.starting_bid_cents())));
  }
  if (bidder.max_bid_cents() < 0) {
    issues.push_back(ValidationIssue(
        bidder.id(), "max_bid", "maximum bid cannot be negative",
        format_cents(bidder.max_bid_cents())));
  }
  if (bidder.auto_increment_cents() <= 0) {
    issues.push_back(ValidationIssue(
        bidder.id(), "auto_increment",
        "auto-increment amount must be greater than zero",
        format_cents(bidder.auto_increment_cents())));
  }
  check_ceiling(bidder, "starting_bid", "starting bid",
                bidder.starting_bid_cents(), &issues);
  check_ceiling(bidder, "max_bid", "maximum bid", bidder.max_bid_cents(),
                &issues);
  check_ceiling(bidder, "auto_increment", "auto-increment amount",
                bidder.auto_increment_cents(), &issues);
  if (bidder.starting_bid_cents() > bidder.max_bid_cents()) {
    issues.push_back(ValidationIssue(
        bidder.id(), "starting_bid",
        "starting bid cannot be greater than maximum bid",
        "starting: " + format_cents(bidder.starting_bid_cents()) +
            ", max: " + format_cents(bidder.max_bid_cents())));
  }
  return issues;
}

void DefaultBidValidator::validate_bidder(const Bidder& bidder) const {
  vector<ValidationIssue> issues = check_bidder(bidder);
  if (issues.empty()) return;

  AuctionError error(ERROR_VALIDATION,
                     "validation failed for bidder " + bidder.id(), issues);
  error.with_operation("validate_bidder")
      .add_context("bidder_id", bidder.id())
      .add_context("bidder_name", bidder.name());
  throw error;
}

void DefaultBidValidator::validate_bidders(
    const vector<Bidder>& bidders) const {
  if (bidders.empty()) {
    AuctionError error(ERROR_VALIDATION, "no bidders provided");
    error.with_operation("validate_bidders").add_context("bidder_count", "0");
    throw error;
  }

  vector<ValidationIssue> all_issues;
  unordered_set<string> seen_ids;
  int valid_bidders = 0;

  for (int i = 0; i < bidders.size(); ++i) {
    const Bidder& bidder = bidders[i];
    if (!seen_ids.insert(bidder.id()).second) {
      all_issues.push_back(ValidationIssue(
          bidder.id(), "id", "duplicate bidder id", bidder.id()));
      continue;
    }

    vector<ValidationIssue> issues = check_bidder(bidder);
    if (issues.empty()) {
      ++valid_bidders;
      continue;
    }
    for (ValidationIssue& issue : issues) {
      issue.value = "position " + to_string(i + 1) + ": " + issue.value;
      all_issues.push_back(issue);
    }
  }

  if (all_issues.empty()) return;

  set<string> invalid_ids;
  for (const ValidationIssue& issue : all_issues) {
    invalid_ids.insert(issue.bidder_id);
  }

  VLOG(1) << all_issues.size() << " validation issues across "
          << invalid_ids.size() << " of " << bidders.size() << " bidders";

  AuctionError error(ERROR_VALIDATION,
                     "validation failed for " + to_string(invalid_ids.size()) +
                         " out of " + to_string(bidders.size()) + " bidders",
                     all_issues);
  error.with_operation("validate_bidders")
      .add_context("total_bidders", to_string(bidders.size()))
      .add_context("valid_bidders", to_string(valid_bidders))
      .add_context("invalid_bidders", to_string(invalid_ids.size()))
      .add_context("total_validation_errors", to_string(all_issues.size()));
  throw error;
}
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
