#include <flamelabel/font/freetype.h>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <ytrace/ytrace.hpp>

namespace flamelabel::font {

FT_Library ftLibrary() {
    thread_local struct FTLib {
        FT_Library lib = nullptr;
        FTLib() {
            if (FT_Error err = FT_Init_FreeType(&lib); err) {
                yerror("FT_Init_FreeType failed: {}", err);
                lib = nullptr;
            }
        }
        ~FTLib() { if (lib) FT_Done_FreeType(lib); }
    } instance;
    return instance.lib;
}

} // namespace flamelabel::font
