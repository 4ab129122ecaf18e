#include <flamelabel/text-truncation.h>

namespace flamelabel {

void trimTextCenter(std::string_view text, size_t length, std::string& out) {
    size_t count = utf8::codepointCount(text);
    if (length >= count) {
        out.assign(text);
        return;
    }

    size_t headCount = length / 2;
    size_t tailCount = length > headCount ? length - headCount - 1 : 0;

    out.assign(utf8::headCodepoints(text, headCount));
    out.append(ELLIPSIS);
    out.append(utf8::tailCodepoints(text, tailCount));
}

std::string trimTextCenter(std::string_view text, size_t length) {
    std::string out;
    trimTextCenter(text, length, out);
    return out;
}

} // namespace flamelabel
