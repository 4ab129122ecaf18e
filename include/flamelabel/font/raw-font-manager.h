#pragma once

#include <flamelabel/font/raw-font.h>
#include <flamelabel/base/object.h>
#include <flamelabel/base/factory.h>
#include <flamelabel/result.hpp>
#include <cstddef>
#include <memory>
#include <string>

namespace flamelabel::font {

/// RawFontManager - thread singleton for creating RawFont instances.
/// Manages the thread-local FreeType library internally.
class RawFontManager : public base::Object,
                       public base::ThreadSingleton<RawFontManager> {
public:
    using Ptr = std::shared_ptr<RawFontManager>;

    ~RawFontManager() override = default;
    const char* typeName() const override { return "RawFontManager"; }

    static Result<Ptr> createImpl();

    /// Create a RawFont from a font file path.
    /// The font is named after the file stem ("DejaVuSans.ttf" -> "DejaVuSans").
    virtual Result<RawFont::Ptr> createFromFile(const std::string& path) = 0;

    /// Fonts created by this manager, keyed by path; a second request
    /// for the same file returns the already loaded font.
    virtual size_t loadedFontCount() const = 0;

protected:
    RawFontManager() = default;
};

} // namespace flamelabel::font
