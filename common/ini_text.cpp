#include "ini_text.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace clipsync::common {

std::string Trim(const std::string& s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

std::string ToLower(std::string s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return s;
}

bool ParseBool(const std::string& text, bool& out) {
  const std::string t = ToLower(Trim(text));
  if (t == "1" || t == "true" || t == "on" || t == "yes") {
    out = true;
    return true;
  }
  if (t == "0" || t == "false" || t == "off" || t == "no") {
    out = false;
    return true;
  }
  return false;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') return false;
  char* end_ptr = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || v > 0xFFFFFFFFull) {
    return false;
  }
  out = static_cast<std::uint32_t>(v);
  return true;
}

bool SplitKeyValue(const std::string& line, std::string& key,
                   std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string::npos) {
    return false;
  }
  key = Trim(line.substr(0, pos));
  value = StripInlineComment(Trim(line.substr(pos + 1)));
  return !key.empty();
}

}  // namespace clipsync::common
