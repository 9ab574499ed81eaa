#ifndef __AUCTION_ERROR_HPP__
#define __AUCTION_ERROR_HPP__

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

enum ErrorType {
  ERROR_VALIDATION,
  ERROR_TIMEOUT,
  ERROR_INTERNAL
};

const char* error_type_name(ErrorType type);

// One offending field of one bidder.
struct ValidationIssue {
  ValidationIssue() {}
  ValidationIssue(const std::string& _bidder_id, const std::string& _field,
                  const std::string& _message, const std::string& _value = "")
      : bidder_id(_bidder_id), field(_field), message(_message),
        value(_value) {}

  std::string describe() const;

  std::string bidder_id;
  std::string field;
  std::string message;
  std::string value;
};

// Every failure surfaced by the auction code. The type tells callers whether
// the input was rejected (validation) or the run itself broke (timeout,
// internal); the context map carries whatever was observed at the time.
class AuctionError : public std::runtime_error {
 public:
  AuctionError(ErrorType _type, const std::string& _message,
               const std::vector<ValidationIssue>& _issues =
                   std::vector<ValidationIssue>());
  virtual ~AuctionError() throw() {}

  virtual const char* what() const throw();

  ErrorType type() const { return type_; }
  const std::string& message() const { return message_; }
  const std::string& operation() const { return operation_; }
  const std::map<std::string, std::string>& context() const {
    return context_;
  }
  const std::vector<ValidationIssue>& issues() const { return issues_; }

  AuctionError& with_operation(const std::string& operation);
  AuctionError& add_context(const std::string& key, const std::string& value);
  AuctionError& add_issue(const ValidationIssue& issue);

  // Returns false if the key was never recorded.
  bool context(const std::string& key, std::string* value) const;

  bool has_validation_issues() const { return !issues_.empty(); }
  std::map<std::string, std::vector<ValidationIssue>> issues_by_field() const;
  std::map<std::string, std::vector<ValidationIssue>> issues_by_bidder() const;

 private:
  void render();

  ErrorType type_;
  std::string message_;
  std::string operation_;
  std::map<std::string, std::string> context_;
  std::vector<ValidationIssue> issues_;
  std::string rendered_;
};

#endif  // __AUCTION_ERROR_HPP__
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
