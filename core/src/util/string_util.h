#pragma once

#include <string>

namespace xlformula::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
std::string to_lower(const std::string& s);
/// Converts a string to uppercase for function-name matching.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
std::string to_upper(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
bool ends_with(const std::string& s, const std::string& suffix);

}  // namespace xlformula::util
