#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace flamelabel::utf8 {

/// Decode one codepoint starting at ptr and advance ptr past it.
/// Malformed lead bytes decode as U+FFFD and consume one byte; truncated
/// sequences stop at end.
uint32_t decodeOne(const uint8_t*& ptr, const uint8_t* end);

/// Number of codepoints in text.
size_t codepointCount(std::string_view text);

/// Byte offset of the codepoint with index cpIndex (text.size() when past the end).
size_t byteOffsetOf(std::string_view text, size_t cpIndex);

/// The first `count` codepoints of text.
std::string_view headCodepoints(std::string_view text, size_t count);

/// The last `count` codepoints of text.
std::string_view tailCodepoints(std::string_view text, size_t count);

} // namespace flamelabel::utf8
