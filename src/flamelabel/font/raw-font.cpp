#include <flamelabel/font/raw-font.h>
#include <flamelabel/font/freetype.h>
#include <flamelabel/utf8.h>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <ytrace/ytrace.hpp>

#include <unordered_map>
#include <vector>

namespace flamelabel::font {

namespace {

// Metrics are queried at this nominal size and scaled at measure time.
constexpr float NOMINAL_SIZE = 32.0f;

} // namespace

class RawFontImpl : public RawFont {
public:
    RawFontImpl(std::vector<uint8_t> data, std::string name)
        : _data(std::move(data)), _name(std::move(name)) {}

    ~RawFontImpl() override {
        if (_face) FT_Done_Face(_face);
    }

    Result<void> init() {
        FT_Library lib = ftLibrary();
        if (!lib) {
            return Err("RawFont: FreeType is not available on this thread");
        }
        FT_Error err = FT_New_Memory_Face(lib,
                                          _data.data(),
                                          static_cast<FT_Long>(_data.size()),
                                          0, &_face);
        if (err) {
            return Err("RawFont: FreeType error " + std::to_string(err) + " loading " + _name);
        }

        FT_Set_Char_Size(_face, 0, static_cast<FT_F26Dot6>(NOMINAL_SIZE * 64), 72, 72);
        _hasKerning = FT_HAS_KERNING(_face);
        ydebug("RawFont: loaded '{}' ({} glyphs, kerning={})",
               _name, _face->num_glyphs, _hasKerning);
        return Ok();
    }

    const std::string& name() const override { return _name; }

    float measureTextWidth(std::string_view text, float fontSize) override {
        if (!_face || text.empty()) return 0.0f;

        const float scale = fontSize / NOMINAL_SIZE;
        float width = 0.0f;
        FT_UInt previous = 0;

        const uint8_t* ptr = reinterpret_cast<const uint8_t*>(text.data());
        const uint8_t* end = ptr + text.size();

        while (ptr < end) {
            uint32_t cp = utf8::decodeOne(ptr, end);
            const Glyph& glyph = glyphFor(cp);

            if (_hasKerning && previous && glyph.index) {
                FT_Vector delta;
                if (FT_Get_Kerning(_face, previous, glyph.index,
                                   FT_KERNING_UNSCALED, &delta) == 0) {
                    width += static_cast<float>(delta.x) * unitsToNominal() * scale;
                }
            }

            width += glyph.advance * scale;
            previous = glyph.index;
        }

        return width;
    }

    float fontAscent(float fontSize) override {
        if (!_face) return fontSize * 0.8f;
        return (_face->size->metrics.ascender / 64.0f) * (fontSize / NOMINAL_SIZE);
    }

    float fontDescent(float fontSize) override {
        if (!_face) return fontSize * 0.2f;
        return (-_face->size->metrics.descender / 64.0f) * (fontSize / NOMINAL_SIZE);
    }

private:
    struct Glyph {
        FT_UInt index = 0;
        float advance = 0.0f;  // at NOMINAL_SIZE
    };

    const Glyph& glyphFor(uint32_t cp) {
        auto it = _glyphCache.find(cp);
        if (it != _glyphCache.end()) return it->second;

        Glyph glyph;
        glyph.index = FT_Get_Char_Index(_face, cp);
        // NO_HINTING skips the TT bytecode interpreter, advances only
        if (FT_Load_Glyph(_face, glyph.index, FT_LOAD_NO_BITMAP | FT_LOAD_NO_HINTING) == 0) {
            glyph.advance = _face->glyph->advance.x / 64.0f;
        } else {
            glyph.advance = NOMINAL_SIZE * 0.5f;
        }
        return _glyphCache.emplace(cp, glyph).first->second;
    }

    // Font units -> pixels at NOMINAL_SIZE
    float unitsToNominal() const {
        return _face->units_per_EM ? NOMINAL_SIZE / static_cast<float>(_face->units_per_EM) : 0.0f;
    }

    std::vector<uint8_t> _data;
    std::string _name;
    FT_Face _face = nullptr;
    bool _hasKerning = false;
    std::unordered_map<uint32_t, Glyph> _glyphCache;
};

Result<RawFont::Ptr> RawFont::createImpl(const uint8_t* data, size_t size,
                                         const std::string& name) {
    if (!data || size == 0) {
        return Err<Ptr>("RawFont: empty font data for " + name);
    }
    std::vector<uint8_t> fontData(data, data + size);
    auto impl = Ptr(new RawFontImpl(std::move(fontData), name));
    auto res = static_cast<RawFontImpl*>(impl.get())->init();
    if (!res) return Err<Ptr>("RawFont creation failed", res);
    return Ok(std::move(impl));
}

} // namespace flamelabel::font
