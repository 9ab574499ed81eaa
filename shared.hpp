#ifndef __SHARED_HPP__
#define __SHARED_HPP__

#include <sstream>
#include <string>
#include <vector>

template <typename T>
std::string join(const std::vector<T>& elems, const char* delim) {
  if (elems.empty())
    return "";

  std::stringstream ss;
  ss << elems[0];
  for (int i = 1; i < elems.size(); ++i) {
    ss << delim << elems[i];
  }
  return ss.str();
}

// Split str on every delim. Empty fields are kept, so "a,,b" has three parts.
std::vector<std::string> split(const std::string& str, char delim);

// Strip leading and trailing whitespace.
std::string trim(const std::string& str);

// Whole-string numeric parses; false on trailing junk or an empty string.
bool parse_double(const std::string& str, double* value);
bool parse_int64(const std::string& str, long long* value);

#endif  // __SHARED_HPP__
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
