#include "util/StringUtil.hpp"

#include "util/Exception.hpp"

#include <charconv>
#include <cstring>
#include <sstream>
#include <system_error>

namespace util {

inline std::vector<std::string> split(const std::string& s, const char* sep) {
  std::vector<std::string> tokens;
  size_t sep_len = std::strlen(sep);

  if (sep_len == 0) {
    std::istringstream ss(s);
    for (std::string token; ss >> token;) {
      tokens.push_back(token);
    }
    return tokens;
  }

  size_t start = 0;
  for (size_t pos = s.find(sep); pos != std::string::npos; pos = s.find(sep, start)) {
    tokens.push_back(s.substr(start, pos - start));
    start = pos + sep_len;
  }
  tokens.push_back(s.substr(start));
  return tokens;
}

inline int atoi_safe(const std::string& s) {
  int value = 0;
  const char* end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, value);
  if (s.empty() || ec != std::errc() || ptr != end) {
    throw util::CleanException("Not an integer: \"{}\"", s);
  }
  return value;
}

}  // namespace util
