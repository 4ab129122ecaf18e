#pragma once

#include <flamelabel/base/object.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace flamelabel {

enum class TextBaseline : uint8_t {
    Alphabetic,
    Top,
    Middle,
    Bottom,
};

const char* textBaselineName(TextBaseline baseline);

//=============================================================================
// TextSurface - 2D raster target the label overlay draws into
//
// Mirrors the small slice of a canvas 2D context the renderer needs.
// State set through setFont/setFillColor/setTextBaseline applies to every
// later measureText/fillText call.
//=============================================================================
class TextSurface : public base::Object {
public:
    using Ptr = std::shared_ptr<TextSurface>;

    ~TextSurface() override = default;
    const char* typeName() const override { return "TextSurface"; }

    virtual void setFont(const std::string& family, float sizePx) = 0;
    virtual void setFillColor(uint32_t color) = 0;
    virtual void setTextBaseline(TextBaseline baseline) = 0;

    /// Advance width of text in physical pixels under the current font.
    virtual float measureText(std::string_view text) = 0;

    /// Draw text with its left edge at x and its baseline at y.
    virtual void fillText(std::string_view text, float x, float y) = 0;

protected:
    TextSurface() = default;
};

} // namespace flamelabel
