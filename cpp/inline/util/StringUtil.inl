#include "util/StringUtil.hpp"

#include <sstream>
#include <string_view>

namespace util {

namespace detail {

constexpr const char* kWhitespace = " \t\n\v\f\r";

}  // namespace detail

inline std::vector<std::string> split(const std::string& s, const char* separator) {
  std::vector<std::string> tokens;
  std::string_view sep(separator);

  if (sep.empty()) {
    std::istringstream ss(s);
    for (std::string token; ss >> token;) {
      tokens.push_back(token);
    }
    return tokens;
  }

  size_t start = 0;
  for (size_t end; (end = s.find(sep, start)) != std::string::npos; start = end + sep.size()) {
    tokens.push_back(s.substr(start, end - start));
  }
  tokens.push_back(s.substr(start));
  return tokens;
}

inline std::string strip(const std::string& s) {
  size_t first = s.find_first_not_of(detail::kWhitespace);
  if (first == std::string::npos) {
    return "";
  }
  size_t last = s.find_last_not_of(detail::kWhitespace);
  return s.substr(first, last - first + 1);
}

}  // namespace util
