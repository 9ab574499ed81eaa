#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

#include "shared.hpp"

using namespace std;

vector<string> split(const string& str, char delim) {
  vector<string> split_v;
  int i = 0;
  string buf = "";
  while (i < str.length()) {
    if (str[i] != delim)
      buf += str[i];
    else {
      split_v.push_back(buf);
      buf = "";
    }
    i++;
  }
  split_v.push_back(buf);
  return split_v;
}

string trim(const string& str) {
  size_t start = 0;
  while (start < str.size() && isspace(static_cast<unsigned char>(str[start])))
    ++start;
  size_t end = str.size();
  while (end > start && isspace(static_cast<unsigned char>(str[end - 1])))
    --end;
  return str.substr(start, end - start);
}

bool parse_double(const string& str, double* value) {
  if (str.empty()) return false;
  char* end = nullptr;
  errno = 0;
  double parsed = strtod(str.c_str(), &end);
  if (errno != 0 || *end != '\0') return false;
  *value = parsed;
  return true;
}

bool parse_int64(const string& str, long long* value) {
  if (str.empty()) return false;
  char* end = nullptr;
  errno = 0;
  long long parsed = strtoll(str.c_str(), &end, 10);
  if (errno != 0 || *end != '\0') return false;
  *value = parsed;
  return true;
}
/* vim: set ts=2 sts=2 sw=2 tw=80 expandtab */
