#include "range_parser.hpp"
#include "errors.hpp"
#include <cctype>
#include <charconv>
#include <cstdint>

static std::string trim(const std::string& s) {
  size_t i = 0; while (i < s.size() && std::isspace((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && std::isspace((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

static bool parse_index(const std::string& s, std::uint64_t& out) {
  if (s.empty()) return false;
  for (unsigned char c : s) if (!std::isdigit(c)) return false;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && p == s.data() + s.size();
}

IndexRange parse_range(const std::string& text) {
  std::string s = trim(text);
  size_t sep = s.find_first_of("-:");
  if (sep == std::string::npos) sep = s.find(' ');
  if (sep == std::string::npos) throw InvalidUserInput("invalid range '" + text + "', use start-end");
  IndexRange r;
  if (!parse_index(trim(s.substr(0, sep)), r.start) || !parse_index(trim(s.substr(sep + 1)), r.end)) {
    throw InvalidUserInput("invalid range '" + text + "', use start-end");
  }
  if (r.end <= r.start) throw InvalidUserInput("invalid range '" + text + "', end must exceed start");
  return r;
}

int parse_count(const std::string& text, const char* what) {
  std::string s = trim(text);
  std::uint64_t v = 0;
  if (!parse_index(s, v) || v == 0 || v > 100000) {
    throw InvalidUserInput(std::string("invalid ") + what + " '" + text + "'");
  }
  return static_cast<int>(v);
}
