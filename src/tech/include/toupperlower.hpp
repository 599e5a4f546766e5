#pragma once

namespace fxc {

constexpr char toupper(char ch) noexcept { return ch >= 'a' && ch <= 'z' ? static_cast<char>(ch - ('a' - 'A')) : ch; }

constexpr char tolower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch; }

constexpr bool isupperalpha(char ch) noexcept { return ch >= 'A' && ch <= 'Z'; }

constexpr bool isloweralpha(char ch) noexcept { return ch >= 'a' && ch <= 'z'; }

}  // namespace fxc
