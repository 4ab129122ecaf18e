#include <flamelabel/label-buffer.h>
#include <flamelabel/theme.h>

#include <yaml-cpp/yaml.h>
#include <ytrace/ytrace.hpp>

namespace flamelabel {

LabelBuffer::LabelBuffer(font::RawFont::Ptr defaultFont)
    : _defaultFont(defaultFont)
    , _activeFont(std::move(defaultFont)) {
}

Result<LabelBuffer::Ptr> LabelBuffer::createImpl(font::RawFont::Ptr defaultFont) {
    if (!defaultFont) {
        return Err<Ptr>("LabelBuffer: a default font is required");
    }
    return Ok(Ptr(new LabelBuffer(std::move(defaultFont))));
}

void LabelBuffer::setFont(const std::string& family, float sizePx) {
    _fontSize = sizePx;
    if (family == _family) return;

    _family = family;
    if (auto it = _fonts.find(family); it != _fonts.end()) {
        _activeFont = it->second;
    } else {
        ydebug("LabelBuffer: no font registered for '{}', using '{}'",
               family, _defaultFont->name());
        _activeFont = _defaultFont;
    }
}

void LabelBuffer::addFont(const std::string& family, font::RawFont::Ptr font) {
    if (!font) {
        ywarn("LabelBuffer: ignoring null font for '{}'", family);
        return;
    }
    if (family == _family) {
        _activeFont = font;
    }
    _fonts[family] = std::move(font);
}

float LabelBuffer::measureText(std::string_view text) {
    ++_measureCount;
    return _activeFont->measureTextWidth(text, _fontSize);
}

void LabelBuffer::fillText(std::string_view text, float x, float y) {
    _textSpans.push_back({x, y, std::string(text), _family, _fontSize, _color, _baseline});
}

void LabelBuffer::clear() {
    _textSpans.clear();
}

std::string LabelBuffer::toYaml() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "spans" << YAML::Value << YAML::BeginSeq;
    for (const auto& span : _textSpans) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "x" << YAML::Value << span.x;
        out << YAML::Key << "y" << YAML::Value << span.y;
        out << YAML::Key << "text" << YAML::Value << YAML::DoubleQuoted << span.text;
        out << YAML::Key << "font-family" << YAML::Value << span.fontFamily;
        out << YAML::Key << "font-size" << YAML::Value << span.fontSize;
        out << YAML::Key << "color" << YAML::Value << formatColor(span.color);
        out << YAML::Key << "baseline" << YAML::Value << textBaselineName(span.baseline);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

} // namespace flamelabel
