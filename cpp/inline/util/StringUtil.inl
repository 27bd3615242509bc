#include "util/StringUtil.hpp"

#include "util/Exceptions.hpp"

#include <cctype>
#include <charconv>
#include <string_view>

namespace util {

inline int atoi_safe(const std::string& s) {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;

  int value = 0;
  const char* first = s.data() + begin;
  const char* last = s.data() + end;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (begin == end || ec != std::errc() || ptr != last) {
    throw util::CleanException("Failed to parse int from \"{}\"", s);
  }
  return value;
}

inline std::vector<std::string> split(const std::string& s, const char* t) {
  std::vector<std::string> result;
  std::string_view sep(t);

  if (sep.empty()) {
    std::size_t pos = 0, n = s.size();
    while (pos < n) {
      while (pos < n && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
      if (pos >= n) break;
      std::size_t start = pos;
      while (pos < n && !std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
      result.emplace_back(s.substr(start, pos - start));
    }
  } else {
    std::size_t start = 0, end;
    while ((end = s.find(sep, start)) != std::string::npos) {
      result.emplace_back(s.substr(start, end - start));
      start = end + sep.size();
    }
    result.emplace_back(s.substr(start));
  }
  return result;
}

inline std::vector<std::string> splitlines(const std::string& s) {
  std::vector<std::string> result;
  std::string::size_type start = 0;
  std::string::size_type end;

  while ((end = s.find('\n', start)) != std::string::npos) {
    result.push_back(s.substr(start, end - start));
    start = end + 1;
  }

  if (start < s.size()) {
    result.push_back(s.substr(start));
  }

  return result;
}

}  // namespace util
