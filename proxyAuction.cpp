#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "auction_error.hpp"
#include "auction_result.hpp"
#include "auction_service.hpp"
#include "bidder.hpp"
#include "bidder_loader.hpp"
#include "precision.hpp"

using namespace std;

DEFINE_string(bidders, "bidders.csv",
    "Bidder file, one 'id,name,start,max,increment[,entry_us]' per line.");

static void print_result(const AuctionResult& result) {
  const Bidder* winner = result.winner();
  if (winner == nullptr) {
    cout << "No winner." << endl;
    return;
  }

  cout << "Winner:       " << winner->name() << " (" << winner->id() << ")"
       << endl;
  cout << "Winning bid:  " << format_cents(result.winning_bid_cents())
       << endl;
  cout << "Bidders:      " << result.total_bidders() << endl;
  cout << "Rounds:       " << result.bidding_rounds() << endl;
  cout << endl;
  cout << left << setw(12) << "ID" << setw(20) << "NAME" << right
       << setw(12) << "START" << setw(12) << "CURRENT" << setw(12) << "MAX"
       << setw(10) << "ACTIVE" << endl;
  for (const Bidder& bidder : result.all_bidders()) {
    cout << left << setw(12) << bidder.id() << setw(20) << bidder.name() << right
         << setw(12) << format_cents(bidder.starting_bid_cents())
         << setw(12) << format_cents(bidder.current_bid_cents())
         << setw(12) << format_cents(bidder.max_bid_cents())
         << setw(10) << (bidder.is_active() ? "yes" : "no") << endl;
  }
}

int main(int argc, char* argv[]) {
  google::SetUsageMessage("Resolve a proxy-bidding auction.");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  try {
    vector<Bidder> bidders = load_bidders_from_file(FLAGS_bidders);
    AuctionService service;
    print_result(service.determine_winner(bidders));
  } catch (const AuctionError& error) {
    LOG(ERROR) << error.what();
    for (const auto& kv : error.context()) {
      LOG(ERROR) << "  " << kv.first << "=" << kv.second;
    }
    for (const ValidationIssue& issue : error.issues()) {
      LOG(ERROR) << "  " << issue.describe();
    }
    return 1;
  }

  return 0;
}
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
