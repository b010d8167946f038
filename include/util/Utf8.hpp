#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace sift::util {

static constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

// Decode one UTF-8 codepoint. Returns bytes consumed (0 on error).
int decode_utf8(const char* s, size_t len, uint32_t* cp);

// Encode one codepoint to UTF-8 bytes. Returns byte count.
int encode_utf8(uint32_t cp, uint8_t out[4]);

// Whole-string conversions. Invalid input bytes decode to U+FFFD, one per byte,
// so offsets into the result stay meaningful for any input.
[[nodiscard]] std::u32string to_u32(std::string_view s);
[[nodiscard]] std::string to_utf8(std::u32string_view s);

} // namespace sift::util
