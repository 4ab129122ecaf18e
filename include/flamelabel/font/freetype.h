#pragma once

typedef struct FT_LibraryRec_* FT_Library;

namespace flamelabel::font {

/// Thread-local FreeType library.
/// FT_Library is not thread-safe, so one instance per thread.
FT_Library ftLibrary();

} // namespace flamelabel::font
