#pragma once

//=============================================================================
// FakeTextSurface
//
// Deterministic TextSurface for tests: every codepoint is charWidth pixels
// wide regardless of font. Changing charWidth simulates a font swap the
// renderer cannot observe directly.
//=============================================================================

#include <flamelabel/text-surface.h>
#include <flamelabel/utf8.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace flamelabel::test {

struct FilledText {
    std::string text;
    float x;
    float y;
};

class FakeTextSurface : public TextSurface {
public:
    using Ptr = std::shared_ptr<FakeTextSurface>;

    static Ptr make(float charWidth = 10.0f) {
        auto surface = std::make_shared<FakeTextSurface>();
        surface->charWidth = charWidth;
        return surface;
    }

    void setFont(const std::string& family, float sizePx) override {
        fontFamily = family;
        fontSize = sizePx;
    }
    void setFillColor(uint32_t c) override { color = c; }
    void setTextBaseline(TextBaseline b) override { baseline = b; }

    float measureText(std::string_view text) override {
        ++measureCalls;
        return static_cast<float>(utf8::codepointCount(text)) * charWidth;
    }

    void fillText(std::string_view text, float x, float y) override {
        filled.push_back({std::string(text), x, y});
    }

    const FilledText* find(std::string_view text) const {
        for (const auto& f : filled) {
            if (f.text == text) return &f;
        }
        return nullptr;
    }

    float charWidth = 10.0f;
    uint64_t measureCalls = 0;

    std::string fontFamily;
    float fontSize = 0.0f;
    uint32_t color = 0;
    TextBaseline baseline = TextBaseline::Top;

    std::vector<FilledText> filled;
};

} // namespace flamelabel::test
