#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "auction_error.hpp"

using namespace std;

const char* error_type_name(ErrorType type) {
  switch (type) {
    case ERROR_VALIDATION: return "validation";
    case ERROR_TIMEOUT: return "timeout";
    case ERROR_INTERNAL: return "internal";
  }
  return "unknown";
}

string ValidationIssue::describe() const {
  stringstream ss;
  ss << "bidder " << bidder_id << ", field " << field << ": " << message;
  if (!value.empty()) ss << " (value: " << value << ")";
  return ss.str();
}

AuctionError::AuctionError(ErrorType _type, const string& _message,
                           const vector<ValidationIssue>& _issues)
    : runtime_error(_message),
      type_(_type),
      message_(_message),
      issues_(_issues) {
  render();
}

const char* AuctionError::what() const throw() {
  return rendered_.c_str();
}

AuctionError& AuctionError::with_operation(const string& operation) {
  operation_ = operation;
  render();
  return *this;
}

AuctionError& AuctionError::add_context(const string& key,
                                        const string& value) {
  context_[key] = value;
  return *this;
}

AuctionError& AuctionError::add_issue(const ValidationIssue& issue) {
  issues_.push_back(issue);
  render();
  return *this;
}

bool AuctionError::context(const string& key, string* value) const {
  auto it = context_.find(key);
  if (it == context_.end()) return false;
  if (value != nullptr) *value = it->second;
  return true;
}

map<string, vector<ValidationIssue>> AuctionError::issues_by_field() const {
  map<string, vector<ValidationIssue>> result;
  for (const ValidationIssue& issue : issues_) {
    result[issue.field].push_back(issue);
  }
  return result;
}

map<string, vector<ValidationIssue>> AuctionError::issues_by_bidder() const {
  map<string, vector<ValidationIssue>> result;
  for (const ValidationIssue& issue : issues_) {
    result[issue.bidder_id].push_back(issue);
  }
  return result;
}

void AuctionError::render() {
  stringstream ss;
  ss << error_type_name(type_) << " error: " << message_;
  if (!operation_.empty()) ss << "; operation: " << operation_;
  if (!issues_.empty()) ss << "; validation errors: " << issues_.size();
  rendered_ = ss.str();
}
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
