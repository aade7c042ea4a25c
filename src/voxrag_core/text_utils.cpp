#include "voxrag_core/text_utils.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>

namespace voxrag_core::text {

std::string trim(const std::string &s) {
  const char *whitespace = " \t\r\n\f\v";
  const auto begin = s.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(whitespace);
  return s.substr(begin, end - begin + 1);
}

bool is_blank(const std::string &s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string utf8_prefix(const std::string &text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  auto it = text.begin();
  auto last_boundary = text.begin();
  try {
    while (it != text.end()) {
      utf8::next(it, text.end());
      if (static_cast<size_t>(it - text.begin()) > max_bytes) {
        break;
      }
      last_boundary = it;
    }
  } catch (const utf8::exception &) {
    return text.substr(0, max_bytes);
  }
  return std::string(text.begin(), last_boundary);
}

}  // namespace voxrag_core::text
