#pragma once

#include <flamelabel/utf8.h>
#include <cstddef>
#include <string>
#include <string_view>

namespace flamelabel {

/// U+2026 HORIZONTAL ELLIPSIS
inline constexpr std::string_view ELLIPSIS = "\xE2\x80\xA6";

/// Center-elide text to `length` visible codepoints, the ellipsis included:
/// floor(length/2) leading codepoints, the ellipsis, and the remaining
/// trailing ones. Text that already has <= length codepoints is copied as is.
void trimTextCenter(std::string_view text, size_t length, std::string& out);
std::string trimTextCenter(std::string_view text, size_t length);

//=============================================================================
// fitLabel - longest center-elided form of label that fits availableWidth
//
// measure(std::string_view) -> float must be non-decreasing in the number of
// kept codepoints, which holds for any left-to-right font. Binary search over
// the elision length keeps the number of measurements logarithmic.
//
// Writes the result into out (its capacity is reused across calls) and
// returns true when the label was shortened. When not even one kept
// codepoint fits, out is ELLIPSIS alone.
//=============================================================================
template<typename Measure>
bool fitLabel(std::string_view label, double availableWidth, Measure&& measure,
              std::string& out) {
    if (measure(label) <= availableWidth) {
        out.assign(label);
        return false;
    }

    size_t count = utf8::codepointCount(label);
    size_t lo = 1;
    size_t hi = count > 0 ? count - 1 : 0;
    size_t best = 0;

    while (lo <= hi) {
        size_t mid = lo + (hi - lo) / 2;
        trimTextCenter(label, mid, out);
        if (measure(std::string_view(out)) <= availableWidth) {
            best = mid;
            lo = mid + 1;
        } else {
            hi = mid - 1;
        }
    }

    if (best == 0) {
        out.assign(ELLIPSIS);
    } else {
        trimTextCenter(label, best, out);
    }
    return true;
}

template<typename Measure>
std::string fitLabel(std::string_view label, double availableWidth, Measure&& measure) {
    std::string out;
    fitLabel(label, availableWidth, measure, out);
    return out;
}

} // namespace flamelabel
