#pragma once

namespace routekit {

constexpr bool isdigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool islower(char ch) { return ch >= 'a' && ch <= 'z'; }

constexpr bool isupper(char ch) { return ch >= 'A' && ch <= 'Z'; }

constexpr char toupper(char ch) { return islower(ch) ? static_cast<char>(ch - 'a' + 'A') : ch; }

// Word character as understood by route paths: [A-Za-z0-9_], ASCII only.
constexpr bool isword(char ch) { return isdigit(ch) || islower(ch) || isupper(ch) || ch == '_'; }

}  // namespace routekit
