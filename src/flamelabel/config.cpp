#include <flamelabel/config.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>

namespace flamelabel {

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map)
    , _configPath(configPath)
    , _cmdOverrides(cmdOverrides) {
}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    loadDefaults();

    if (!_configPath.empty()) {
        if (auto res = loadFile(_configPath); !res) {
            return res;
        }
        _loadedFrom = _configPath;
        yinfo("Loaded config from: {}", _configPath);
    } else {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            if (auto res = loadFile(xdgPath.string()); !res) {
                ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
            } else {
                _loadedFrom = xdgPath.string();
                yinfo("Loaded config from: {}", _loadedFrom);
            }
        }
    }

    try {
        applyEnvOverrides(_config, "");

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err("Invalid config override: " + std::string(e.what()));
    }

    return Ok();
}

void Config::loadDefaults() {
    YAML::Node theme(YAML::NodeType::Map);
    theme["font-family"] = "monospace";
    theme["font-size"] = 11;
    theme["bar-height"] = 20;
    theme["bar-padding"] = 4;
    theme["label-color"] = "#000000";
    theme["device-pixel-ratio"] = 1;
    theme["text-cache-capacity"] = 0;
    _config["theme"] = theme;
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (!fileConfig || fileConfig.IsNull()) {
            return Ok();
        }
        if (!fileConfig.IsMap()) {
            return Err("Config file is not a YAML mapping: " + path);
        }
        mergeNodes(_config, fileConfig);
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err("YAML parse error in " + path + ": " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "/" + key;

        if (it->second.IsMap()) {
            applyEnvOverrides(it->second, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        if (const char* val = std::getenv(envVar.c_str())) {
            it->second = std::string(val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

std::vector<std::string> Config::splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string part;
    for (char c : path) {
        if (c == '/' || c == '.') {
            if (!part.empty()) parts.push_back(std::move(part));
            part.clear();
        } else {
            part += c;
        }
    }
    if (!part.empty()) parts.push_back(std::move(part));
    return parts;
}

// Recursive so no YAML::Node is ever reassigned; Node::operator= writes
// through to the referenced node instead of rebinding.
static YAML::Node lookup(const YAML::Node& node, const std::vector<std::string>& parts,
                         size_t index) {
    if (index == parts.size()) return node;
    if (!node.IsMap()) return YAML::Node();
    const YAML::Node child = node[parts[index]];
    if (!child) return YAML::Node();
    return lookup(child, parts, index + 1);
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) return _config;
    return lookup(_config, parts, 0);
}

bool Config::has(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) return false;
    YAML::Node node = lookup(_config, parts, 0);
    return node.IsDefined() && !node.IsNull();
}

static void assign(YAML::Node node, const std::vector<std::string>& parts,
                   size_t index, const std::string& value) {
    const std::string& key = parts[index];
    if (index + 1 == parts.size()) {
        node[key] = value;
        return;
    }
    if (!node[key].IsMap()) {
        node[key] = YAML::Node(YAML::NodeType::Map);
    }
    assign(node[key], parts, index + 1, value);
}

void Config::set(const std::string& path, const std::string& value) {
    auto parts = splitPath(path);
    if (parts.empty()) return;
    assign(_config, parts, 0, value);
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& val = it->second;
        if (val.IsMap() && target[key].IsMap()) {
            mergeNodes(target[key], val);
        } else {
            target[key] = YAML::Clone(val);
        }
    }
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else if (const char* home = std::getenv("HOME")) {
        configDir = std::filesystem::path(home) / ".config";
    } else {
        configDir = "/tmp";
    }
    return configDir / "flamelabel" / "config.yaml";
}

} // namespace flamelabel
