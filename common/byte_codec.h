#ifndef CLIPSYNC_COMMON_BYTE_CODEC_H
#define CLIPSYNC_COMMON_BYTE_CODEC_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace clipsync::common {

std::string BytesToHexLower(const std::uint8_t* data, std::size_t len);
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);

// RFC 4648 base64 with '=' padding.
std::string Base64Encode(const std::uint8_t* data, std::size_t len);
std::string Base64Encode(const std::vector<std::uint8_t>& data);

// Strict decoder: rejects characters outside the alphabet, bad padding and
// lengths that are not a multiple of four. Empty input decodes to empty.
bool Base64Decode(std::string_view text, std::vector<std::uint8_t>& out);

}  // namespace clipsync::common

#endif  // CLIPSYNC_COMMON_BYTE_CODEC_H
