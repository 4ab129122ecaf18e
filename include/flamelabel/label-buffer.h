#pragma once

#include <flamelabel/base/factory.h>
#include <flamelabel/font/raw-font.h>
#include <flamelabel/result.hpp>
#include <flamelabel/text-surface.h>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace flamelabel {

//=============================================================================
// TextSpan - one recorded fillText call
//=============================================================================
struct TextSpan {
    float x, y;
    std::string text;
    std::string fontFamily;
    float fontSize;
    uint32_t color;
    TextBaseline baseline;
};

//=============================================================================
// LabelBuffer - TextSurface that records text spans instead of rasterizing
//
// Widths come from a RawFont registered for the active family, falling back
// to the default font. A host replays the spans on its own backend.
//=============================================================================
class LabelBuffer : public TextSurface,
                    public base::ObjectFactory<LabelBuffer> {
public:
    using Ptr = std::shared_ptr<LabelBuffer>;

    static Result<Ptr> createImpl(font::RawFont::Ptr defaultFont);

    ~LabelBuffer() override = default;
    const char* typeName() const override { return "LabelBuffer"; }

    // --- TextSurface ---
    void setFont(const std::string& family, float sizePx) override;
    void setFillColor(uint32_t color) override { _color = color; }
    void setTextBaseline(TextBaseline baseline) override { _baseline = baseline; }
    float measureText(std::string_view text) override;
    void fillText(std::string_view text, float x, float y) override;

    // --- Fonts ---
    void addFont(const std::string& family, font::RawFont::Ptr font);
    const std::string& fontFamily() const { return _family; }
    float fontSize() const { return _fontSize; }

    // --- Text span storage ---
    template<typename F>
    void forEachTextSpan(F&& fn) const {
        for (const auto& span : _textSpans) {
            fn(span);
        }
    }

    const std::vector<TextSpan>& textSpans() const { return _textSpans; }
    uint32_t textSpanCount() const { return static_cast<uint32_t>(_textSpans.size()); }
    bool empty() const { return _textSpans.empty(); }
    void clear();

    /// Number of measureText calls since creation.
    uint64_t measureCount() const { return _measureCount; }

    /// Spans as a YAML document: a "spans" sequence of
    /// {x, y, text, font-family, font-size, color, baseline}.
    std::string toYaml() const;

private:
    explicit LabelBuffer(font::RawFont::Ptr defaultFont);

    font::RawFont::Ptr _defaultFont;
    font::RawFont::Ptr _activeFont;
    std::unordered_map<std::string, font::RawFont::Ptr> _fonts;

    std::string _family;
    float _fontSize = 10.0f;
    uint32_t _color = 0xFF000000;
    TextBaseline _baseline = TextBaseline::Alphabetic;

    std::vector<TextSpan> _textSpans;
    uint64_t _measureCount = 0;
};

} // namespace flamelabel
