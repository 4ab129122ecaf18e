#pragma once

#include <flamelabel/config.h>
#include <flamelabel/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace flamelabel {

/// Packs 8-bit channels into the 0xAABBGGRR layout used for all colors.
constexpr uint32_t packColor(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF) {
    return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(b) << 16)
         | (static_cast<uint32_t>(g) << 8) | static_cast<uint32_t>(r);
}

/// Parse "#rrggbb" or "#rrggbbaa".
Result<uint32_t> parseColor(std::string_view text);

/// Inverse of parseColor, always "#rrggbbaa".
std::string formatColor(uint32_t color);

//=============================================================================
// Theme - typography and bar metrics for the label overlay
//
// Sizes are in CSS-like logical units; the renderer scales them by
// devicePixelRatio.
//=============================================================================
struct Theme {
    std::string fontFamily = "monospace";
    float fontSize = 11.0f;
    float barHeight = 20.0f;
    float barPadding = 4.0f;
    uint32_t labelColor = packColor(0, 0, 0);
    float devicePixelRatio = 1.0f;
    size_t textCacheCapacity = 0;  // 0 = unbounded

    /// Read the theme/* keys; missing keys keep the defaults above.
    static Result<Theme> fromConfig(const Config& config);

    Result<void> validate() const;
};

} // namespace flamelabel
