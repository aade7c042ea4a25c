#pragma once

#include <string>

namespace voxrag_core::text {

// Strips leading and trailing ASCII whitespace
std::string trim(const std::string &s);

bool is_blank(const std::string &s);

// Longest prefix of at most max_bytes that ends on a UTF-8 code point
// boundary. Invalid UTF-8 is cut at the byte limit.
std::string utf8_prefix(const std::string &text, size_t max_bytes);

}  // namespace voxrag_core::text
