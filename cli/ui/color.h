#pragma once

namespace xlformula::cli {

/// ANSI escape sequences for terminal output.
struct AnsiColors {
  const char* red = "\033[31m";
  const char* yellow = "\033[33m";
  const char* reset = "\033[0m";
};

inline constexpr AnsiColors kColor{};

}  // namespace xlformula::cli
