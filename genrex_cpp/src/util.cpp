#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace genrex {

std::string preview_for_log(std::string_view s, size_t max_len) {
  std::string out;
  out.reserve(std::min(max_len, s.size()) + 32);
  for (size_t i = 0; i < s.size() && i < max_len; i++) {
    unsigned char c = (unsigned char)s[i];
    if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else if (std::isprint(c)) {
      out.push_back((char)c);
    } else {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\x%02X", (unsigned)c);
      out += buf;
    }
  }
  if (s.size() > max_len) out += "...(truncated)";
  return out;
}

std::string getenv_str(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

bool getenv_bool(const char* name) {
  auto v = getenv_str(name);
  std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
  return (v == "1" || v == "true" || v == "yes");
}

std::string trim(std::string_view s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace((unsigned char)s[begin])) begin++;
  while (end > begin && std::isspace((unsigned char)s[end - 1])) end--;
  return std::string(s.substr(begin, end - begin));
}

size_t utf8_char_len(std::string_view s, size_t i) {
  unsigned char lead = (unsigned char)s[i];
  size_t len = 1;
  if (lead >= 0xC2 && lead <= 0xDF) {
    len = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    len = 3;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    len = 4;
  }
  if (i + len > s.size()) return 1;
  for (size_t k = 1; k < len; k++) {
    if (((unsigned char)s[i + k] & 0xC0) != 0x80) return 1;
  }
  return len;
}

}  // namespace genrex
