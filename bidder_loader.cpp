#include <cmath>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

#include <glog/logging.h>

#include "auction_error.hpp"
#include "bidder.hpp"
#include "bidder_loader.hpp"
#include "shared.hpp"

using namespace std;

static AuctionError malformed(const string& message, int line_num,
                              const string& line) {
  AuctionError error(ERROR_VALIDATION, message);
  error.with_operation("load_bidders")
      .add_context("line", to_string(line_num))
      .add_context("content", line);
  return error;
}

static double parse_amount(const string& field, const char* what,
                           int line_num, const string& line) {
  double value;
  if (!parse_double(field, &value) || !isfinite(value)) {
    throw malformed(string("invalid ") + what + " '" + field + "'",
                    line_num, line);
  }
  return value;
}

vector<Bidder> load_bidders(istream& in, Timestamp base_time) {
  vector<Bidder> bidders;
  string line;
  int line_num = 0;

  while (getline(in, line)) {
    ++line_num;
    string content = trim(line);
    if (content.empty() || content[0] == '#') continue;

    vector<string> fields = split(content, ',');
    if (fields.size() != 5 && fields.size() != 6) {
      throw malformed("expected 5 or 6 fields, got " +
                          to_string(fields.size()),
                      line_num, line);
    }
    for (string& field : fields) {
      field = trim(field);
    }

    double starting_bid = parse_amount(fields[2], "starting bid", line_num,
                                       line);
    double max_bid = parse_amount(fields[3], "maximum bid", line_num, line);
    double auto_increment = parse_amount(fields[4], "auto-increment",
                                         line_num, line);

    Timestamp entry_time = base_time + static_cast<Timestamp>(bidders.size());
    if (fields.size() == 6) {
      long long explicit_time;
      if (!parse_int64(fields[5], &explicit_time)) {
        throw malformed("invalid entry time '" + fields[5] + "'", line_num,
                        line);
      }
      entry_time = explicit_time;
    }

    bidders.push_back(Bidder(fields[0], fields[1], starting_bid, max_bid,
                             auto_increment, entry_time));
    VLOG(2) << "Loaded line " << line_num << ": " << bidders.back();
  }
  return bidders;
}

vector<Bidder> load_bidders_from_file(const string& path) {
  ifstream file(path);
  if (!file.is_open()) {
    AuctionError error(ERROR_VALIDATION, "cannot open bidder file " + path);
    error.with_operation("load_bidders_from_file").add_context("path", path);
    throw error;
  }
  vector<Bidder> bidders = load_bidders(file, now_micros());
  VLOG(1) << "Loaded " << bidders.size() << " bidders from " << path;
  return bidders;
}
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
