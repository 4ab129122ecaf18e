#pragma once

#include <flamelabel/base/object.h>
#include <flamelabel/base/factory.h>
#include <flamelabel/result.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace flamelabel::font {

/// RawFont - FreeType-based font used purely for text measurement.
/// No GPU dependencies; glyph rasterization belongs to the host backend.
class RawFont : public base::Object,
                public base::ObjectFactory<RawFont> {
public:
    using Ptr = std::shared_ptr<RawFont>;

    ~RawFont() override = default;
    const char* typeName() const override { return "RawFont"; }

    /// Create from raw TTF/OTF data (copied).
    static Result<Ptr> createImpl(const uint8_t* data, size_t size, const std::string& name);

    virtual const std::string& name() const = 0;

    /// Advance width of text at fontSize pixels, kerning applied.
    virtual float measureTextWidth(std::string_view text, float fontSize) = 0;
    virtual float fontAscent(float fontSize) = 0;
    virtual float fontDescent(float fontSize) = 0;

protected:
    RawFont() = default;
};

} // namespace flamelabel::font
