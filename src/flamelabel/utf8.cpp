#include <flamelabel/utf8.h>

namespace flamelabel::utf8 {

namespace {

constexpr uint32_t REPLACEMENT = 0xFFFD;

inline bool isContinuation(uint8_t b) {
    return (b & 0xC0) == 0x80;
}

} // namespace

uint32_t decodeOne(const uint8_t*& ptr, const uint8_t* end) {
    uint8_t lead = *ptr++;
    if ((lead & 0x80) == 0) return lead;

    int extra = 0;
    uint32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        extra = 3;
    } else {
        return REPLACEMENT;
    }

    for (int i = 0; i < extra; ++i) {
        if (ptr >= end || !isContinuation(*ptr)) return REPLACEMENT;
        cp = (cp << 6) | (*ptr++ & 0x3F);
    }
    return cp;
}

size_t codepointCount(std::string_view text) {
    size_t count = 0;
    for (char c : text) {
        if (!isContinuation(static_cast<uint8_t>(c))) ++count;
    }
    return count;
}

size_t byteOffsetOf(std::string_view text, size_t cpIndex) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (isContinuation(static_cast<uint8_t>(text[i]))) continue;
        if (seen == cpIndex) return i;
        ++seen;
    }
    return text.size();
}

std::string_view headCodepoints(std::string_view text, size_t count) {
    return text.substr(0, byteOffsetOf(text, count));
}

std::string_view tailCodepoints(std::string_view text, size_t count) {
    size_t total = codepointCount(text);
    if (count >= total) return text;
    return text.substr(byteOffsetOf(text, total - count));
}

} // namespace flamelabel::utf8
