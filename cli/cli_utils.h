#pragma once

#include <string>

namespace xlformula::cli {

/// Reads an entire file as bytes.
/// MUST throw std::runtime_error when the file cannot be opened.
std::string read_file(const std::string& path);
std::string read_stdin();
/// Validates UTF-8 byte sequences, rejecting overlongs and surrogates.
bool is_valid_utf8(const std::string& data);
/// Returns true when stderr is attached to a terminal.
bool stderr_is_tty();

}  // namespace xlformula::cli
