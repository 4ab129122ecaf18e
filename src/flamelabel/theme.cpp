#include <flamelabel/theme.h>

#include <cmath>
#include <cstdio>

namespace flamelabel {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Result<uint32_t> parseColor(std::string_view text) {
    if (text.empty() || text.front() != '#') {
        return Err<uint32_t>("color must start with '#': " + std::string(text));
    }
    text.remove_prefix(1);
    if (text.size() != 6 && text.size() != 8) {
        return Err<uint32_t>("color must be #rrggbb or #rrggbbaa: #" + std::string(text));
    }

    uint8_t channels[4] = {0, 0, 0, 0xFF};
    for (size_t i = 0; i < text.size() / 2; ++i) {
        int hi = hexValue(text[2 * i]);
        int lo = hexValue(text[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return Err<uint32_t>("invalid hex digit in color: #" + std::string(text));
        }
        channels[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Ok(packColor(channels[0], channels[1], channels[2], channels[3]));
}

std::string formatColor(uint32_t color) {
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x",
                  color & 0xFF, (color >> 8) & 0xFF,
                  (color >> 16) & 0xFF, (color >> 24) & 0xFF);
    return buf;
}

Result<Theme> Theme::fromConfig(const Config& config) {
    Theme theme;

    theme.fontFamily = config.get<std::string>(Config::KEY_FONT_FAMILY, theme.fontFamily);

    auto readFloat = [&](const char* key, float& out) -> Result<void> {
        if (!config.has(key)) return Ok();
        auto value = config.get<float>(key);
        if (!value) return Err(std::string("not a number: ") + key);
        out = *value;
        return Ok();
    };

    if (auto res = readFloat(Config::KEY_FONT_SIZE, theme.fontSize); !res) {
        return Err<Theme>("Theme", res);
    }
    if (auto res = readFloat(Config::KEY_BAR_HEIGHT, theme.barHeight); !res) {
        return Err<Theme>("Theme", res);
    }
    if (auto res = readFloat(Config::KEY_BAR_PADDING, theme.barPadding); !res) {
        return Err<Theme>("Theme", res);
    }
    if (auto res = readFloat(Config::KEY_DEVICE_PIXEL_RATIO, theme.devicePixelRatio); !res) {
        return Err<Theme>("Theme", res);
    }

    if (config.has(Config::KEY_TEXT_CACHE_CAPACITY)) {
        auto capacity = config.get<int64_t>(Config::KEY_TEXT_CACHE_CAPACITY);
        if (!capacity || *capacity < 0) {
            return Err<Theme>("Theme: text-cache-capacity must be a non-negative integer");
        }
        theme.textCacheCapacity = static_cast<size_t>(*capacity);
    }

    if (auto color = config.get<std::string>(Config::KEY_LABEL_COLOR)) {
        auto parsed = parseColor(*color);
        if (!parsed) return Err<Theme>("Theme: label-color", parsed);
        theme.labelColor = *parsed;
    }

    if (auto res = theme.validate(); !res) {
        return Err<Theme>("Theme", res);
    }
    return Ok(std::move(theme));
}

Result<void> Theme::validate() const {
    if (fontFamily.empty()) return Err("font-family is empty");
    if (!std::isfinite(fontSize) || fontSize <= 0.0f) return Err("font-size must be positive");
    if (!std::isfinite(barHeight) || barHeight <= 0.0f) return Err("bar-height must be positive");
    if (!std::isfinite(barPadding) || barPadding < 0.0f) return Err("bar-padding must not be negative");
    if (!std::isfinite(devicePixelRatio) || devicePixelRatio <= 0.0f) {
        return Err("device-pixel-ratio must be positive");
    }
    return Ok();
}

} // namespace flamelabel
