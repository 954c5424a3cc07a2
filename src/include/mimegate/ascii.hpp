#pragma once

#include <string>
#include <string_view>

namespace mimegate {

  // ASCII-only character classes and case folding. Nothing here consults the
  // C locale, so results are identical on every host.

  inline bool
  is_upper(char c) {
    return c >= 'A' && c <= 'Z';
  }

  inline bool
  is_alpha(char c) {
    return is_upper(c) || (c >= 'a' && c <= 'z');
  }

  inline bool
  is_digit(char c) {
    return c >= '0' && c <= '9';
  }

  // Restricted-name alphabet for type, subtype, attribute and bare values.
  inline bool
  is_token_char(char c) {
    if (is_alpha(c) || is_digit(c)) return true;
    switch (c) {
      case '!':
      case '#':
      case '$':
      case '&':
      case '-':
      case '^':
      case '_':
      case '.':
      case '+':
        return true;
      default:
        return false;
    }
  }

  inline bool
  is_token(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s)
      if (!is_token_char(c)) return false;
    return true;
  }

  // OWS
  inline bool
  is_space(char c) {
    return c == ' ' || c == '\t';
  }

  inline char
  to_lower(char c) {
    if (is_upper(c)) return static_cast<char>(c - 'A' + 'a');
    return c;
  }

  inline std::string
  to_lower(std::string_view s) {
    std::string result(s);
    for (auto& c : result)
      c = to_lower(c);
    return result;
  }

  inline bool
  iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i)
      if (to_lower(a[i]) != to_lower(b[i])) return false;
    return true;
  }

} // namespace mimegate
