#ifndef CLIPSYNC_COMMON_INI_TEXT_H
#define CLIPSYNC_COMMON_INI_TEXT_H

#include <cstdint>
#include <string>

namespace clipsync::common {

std::string Trim(const std::string& s);
// Drops a '#' or ';' comment that starts the line or follows whitespace.
std::string StripInlineComment(const std::string& input);
std::string ToLower(std::string s);

bool ParseBool(const std::string& text, bool& out);
bool ParseUint32(const std::string& text, std::uint32_t& out);

// Splits "key=value" after trimming; false when there is no '='.
bool SplitKeyValue(const std::string& line, std::string& key,
                   std::string& value);

}  // namespace clipsync::common

#endif  // CLIPSYNC_COMMON_INI_TEXT_H
