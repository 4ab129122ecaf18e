#include <flamelabel/font/raw-font-manager.h>
#include <flamelabel/font/freetype.h>

#include <ytrace/ytrace.hpp>

#include <filesystem>
#include <fstream>
#include <unordered_map>
#include <vector>

namespace flamelabel::font {

class RawFontManagerImpl : public RawFontManager {
public:
    RawFontManagerImpl() = default;
    ~RawFontManagerImpl() override = default;

    Result<void> init() {
        if (!ftLibrary()) {
            return Err("RawFontManager: Failed to initialize FreeType");
        }
        return Ok();
    }

    Result<RawFont::Ptr> createFromFile(const std::string& path) override {
        if (auto it = _byPath.find(path); it != _byPath.end()) {
            return Ok(it->second);
        }

        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            return Err<RawFont::Ptr>("RawFontManager: Failed to open file: " + path);
        }

        auto fileSize = file.tellg();
        if (fileSize <= 0) {
            return Err<RawFont::Ptr>("RawFontManager: Empty or invalid file: " + path);
        }

        file.seekg(0, std::ios::beg);
        std::vector<uint8_t> data(static_cast<size_t>(fileSize));
        if (!file.read(reinterpret_cast<char*>(data.data()), fileSize)) {
            return Err<RawFont::Ptr>("RawFontManager: Failed to read file: " + path);
        }

        std::string name = std::filesystem::path(path).stem().string();

        auto font = RawFont::create(data.data(), data.size(), name);
        if (!font) {
            return Err<RawFont::Ptr>("RawFontManager: cannot load " + path, font);
        }
        yinfo("RawFontManager: loaded font '{}' from {}", name, path);
        _byPath.emplace(path, *font);
        return font;
    }

    size_t loadedFontCount() const override { return _byPath.size(); }

private:
    std::unordered_map<std::string, RawFont::Ptr> _byPath;
};

Result<RawFontManager::Ptr> RawFontManager::createImpl() {
    auto impl = Ptr(new RawFontManagerImpl());
    auto res = static_cast<RawFontManagerImpl*>(impl.get())->init();
    if (!res) return Err<Ptr>("RawFontManager creation failed", res);
    return Ok(std::move(impl));
}

} // namespace flamelabel::font
