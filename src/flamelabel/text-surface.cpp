#include <flamelabel/text-surface.h>

namespace flamelabel {

const char* textBaselineName(TextBaseline baseline) {
    switch (baseline) {
        case TextBaseline::Alphabetic: return "alphabetic";
        case TextBaseline::Top: return "top";
        case TextBaseline::Middle: return "middle";
        case TextBaseline::Bottom: return "bottom";
    }
    return "unknown";
}

} // namespace flamelabel
