#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "byte_codec.h"
#include "ini_text.h"

using clipsync::common::Base64Decode;
using clipsync::common::Base64Encode;
using clipsync::common::BytesToHexLower;
using clipsync::common::HexToBytes;

namespace {

std::vector<std::uint8_t> Bytes(const std::string& s) {
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

void TestBase64Vectors() {
  // RFC 4648 section 10.
  const struct {
    const char* plain;
    const char* encoded;
  } kVectors[] = {
      {"", ""},         {"f", "Zg=="},         {"fo", "Zm8="},
      {"foo", "Zm9v"},  {"foob", "Zm9vYg=="},  {"fooba", "Zm9vYmE="},
      {"foobar", "Zm9vYmFy"},
  };
  for (const auto& v : kVectors) {
    assert(Base64Encode(Bytes(v.plain)) == v.encoded);
    std::vector<std::uint8_t> out;
    assert(Base64Decode(v.encoded, out));
    assert(out == Bytes(v.plain));
  }

  const std::vector<std::uint8_t> binary = {0x00, 0xFF, 0xFE, 0x80, 0x7F};
  std::vector<std::uint8_t> out;
  assert(Base64Encode(binary) == "AP/+gH8=");
  assert(Base64Decode("AP/+gH8=", out));
  assert(out == binary);
}

void TestBase64Rejects() {
  std::vector<std::uint8_t> out = {1, 2, 3};
  assert(!Base64Decode("Zg=", out));
  assert(out.empty());
  assert(!Base64Decode("Zg==Zg==", out));
  assert(!Base64Decode("Z===", out));
  assert(!Base64Decode("Zm9v!A==", out));
  assert(!Base64Decode("Zm 9", out));
  assert(!Base64Decode("Zm=v", out));
  assert(!Base64Decode("hello world!", out));
}

void TestHex() {
  const std::uint8_t raw[] = {0x00, 0x0A, 0xBC, 0xFF};
  assert(BytesToHexLower(raw, sizeof(raw)) == "000abcff");
  assert(BytesToHexLower(nullptr, 0).empty());
  std::vector<std::uint8_t> out;
  assert(HexToBytes("000ABCff", out));
  assert(out == std::vector<std::uint8_t>(raw, raw + sizeof(raw)));
  assert(!HexToBytes("abc", out));
  assert(!HexToBytes("zz", out));
  assert(out.empty());
  assert(!HexToBytes("", out));
}

void TestIniText() {
  using namespace clipsync::common;
  assert(Trim("  a b \t") == "a b");
  assert(Trim("   ").empty());
  assert(StripInlineComment("value  # note") == "value");
  assert(StripInlineComment("; whole line").empty());
  assert(StripInlineComment("a#b") == "a#b");
  bool b = false;
  assert(ParseBool(" Yes ", b) && b);
  assert(ParseBool("off", b) && !b);
  assert(!ParseBool("maybe", b));
  std::uint32_t n = 0;
  assert(ParseUint32("4294967295", n) && n == 4294967295u);
  assert(!ParseUint32("4294967296", n));
  assert(!ParseUint32("-1", n));
  assert(!ParseUint32("12ms", n));
  assert(!ParseUint32("", n));
  std::string key;
  std::string value;
  assert(SplitKeyValue(" level = debug ; verbose", key, value));
  assert(key == "level" && value == "debug");
  assert(!SplitKeyValue("novalue", key, value));
  assert(!SplitKeyValue("=x", key, value));
}

}  // namespace

int main() {
  TestBase64Vectors();
  TestBase64Rejects();
  TestHex();
  TestIniText();
  std::cout << "byte_codec_test ok\n";
  return 0;
}
