#ifndef __BIDDER_LOADER_HPP__
#define __BIDDER_LOADER_HPP__

#include <istream>
#include <string>
#include <vector>

#include "bidder.hpp"

// Reads one bidder per line:
//
//   id,name,starting_bid,max_bid,auto_increment[,entry_time_us]
//
// Blank lines and lines starting with '#' are skipped. A bidder without an
// entry time is stamped base_time plus its record number, so file order is
// submission order. Malformed lines throw AuctionError (ERROR_VALIDATION).
std::vector<Bidder> load_bidders(std::istream& in, Timestamp base_time);

std::vector<Bidder> load_bidders_from_file(const std::string& path);

#endif  // __BIDDER_LOADER_HPP__
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
