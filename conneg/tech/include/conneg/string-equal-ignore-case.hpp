#pragma once

#include <cstddef>
#include <string_view>

namespace conneg {

constexpr char tolower(char ch) {
  auto uch = static_cast<unsigned char>(ch);
  if (uch >= 'A' && uch <= 'Z') {
    uch |= 0x20;
  }
  return static_cast<char>(uch);
}

// Header field names are case-insensitive (RFC 9110 section 5.1).
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

}  // namespace conneg
