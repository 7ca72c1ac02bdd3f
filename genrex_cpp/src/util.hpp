#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace genrex {

// Escapes control bytes and truncates, so generated text is safe to put on one log line.
std::string preview_for_log(std::string_view s, size_t max_len = 200);

std::string getenv_str(const char* name);
bool getenv_bool(const char* name);

std::string trim(std::string_view s);

// Byte length of the UTF-8 sequence starting at s[i]. A stray continuation
// byte, an invalid lead byte or a truncated sequence counts as one byte.
size_t utf8_char_len(std::string_view s, size_t i);

}  // namespace genrex
