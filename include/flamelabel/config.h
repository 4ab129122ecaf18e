#pragma once

#include <flamelabel/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flamelabel {

//=============================================================================
// Config - YAML configuration tree
//
// Layering, lowest to highest priority:
//   built-in defaults < config file < FLAMELABEL_* env vars < cmd overrides
//
// Paths use '/' or '.' as separator: "theme/font-size" == "theme.font-size".
//=============================================================================
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    /// configPath empty: use $XDG_CONFIG_HOME/flamelabel/config.yaml if it exists.
    /// An explicit configPath that cannot be loaded is an error.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Returns nullopt if the key doesn't exist or doesn't convert to T
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    /// Set a scalar value, creating intermediate maps.
    void set(const std::string& path, const std::string& value);

    /// Path the file layer was loaded from; empty when none was.
    const std::string& loadedFrom() const { return _loadedFrom; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "FLAMELABEL_";

    static constexpr const char* KEY_FONT_FAMILY = "theme/font-family";
    static constexpr const char* KEY_FONT_SIZE = "theme/font-size";
    static constexpr const char* KEY_BAR_HEIGHT = "theme/bar-height";
    static constexpr const char* KEY_BAR_PADDING = "theme/bar-padding";
    static constexpr const char* KEY_LABEL_COLOR = "theme/label-color";
    static constexpr const char* KEY_DEVICE_PIXEL_RATIO = "theme/device-pixel-ratio";
    static constexpr const char* KEY_TEXT_CACHE_CAPACITY = "theme/text-cache-capacity";

    // Convert a path to its env var name ("theme/font-size" -> "FLAMELABEL_THEME_FONT_SIZE")
    static std::string pathToEnvVar(const std::string& path);

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    static std::vector<std::string> splitPath(const std::string& path);
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedFrom;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull() || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace flamelabel
