//=============================================================================
// Config + Theme Unit Tests
//
// Defaults, file loading, FLAMELABEL_* env overrides, command-line
// overrides, color parsing and Theme::fromConfig validation.
//=============================================================================

#include <cstddef>
#include <version>

#include <boost/ut.hpp>

#include <flamelabel/config.h>
#include <flamelabel/theme.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace boost::ut;
using namespace flamelabel;

namespace fs = std::filesystem;

namespace {

// Per-test scratch directory, also used as XDG_CONFIG_HOME so a user
// config on the test machine never leaks in.
struct ScratchDir {
    fs::path path;

    ScratchDir() {
        path = fs::temp_directory_path() /
               ("flamelabel-config-test-" + std::to_string(::getpid()));
        fs::create_directories(path);
        ::setenv("XDG_CONFIG_HOME", path.c_str(), 1);
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string write(const std::string& name, const std::string& content) const {
        auto file = path / name;
        std::ofstream out(file);
        out << content;
        return file.string();
    }
};

} // namespace

suite config_tests = [] {

    "defaults are present without a file"_test = [] {
        ScratchDir dir;
        auto config = Config::create();
        expect(config.has_value()) << error_msg(config);
        if (!config) return;

        expect((*config)->loadedFrom().empty());
        expect((*config)->get<std::string>(Config::KEY_FONT_FAMILY, "") == "monospace");
        expect((*config)->get<float>(Config::KEY_FONT_SIZE, 0.0f) == 11.0f);
        expect((*config)->get<int>(Config::KEY_TEXT_CACHE_CAPACITY, -1) == 0);
    };

    "file values override defaults"_test = [] {
        ScratchDir dir;
        auto path = dir.write("cfg.yaml",
            "theme:\n"
            "  font-size: 14\n"
            "  label-color: '#ff0000'\n");

        auto config = Config::create(path);
        expect(config.has_value()) << error_msg(config);
        if (!config) return;

        expect((*config)->loadedFrom() == path);
        expect((*config)->get<float>("theme/font-size", 0.0f) == 14.0f);
        expect((*config)->get<float>("theme.font-size", 0.0f) == 14.0f) << "dotted path";
        expect((*config)->get<std::string>("theme/font-family", "") == "monospace")
            << "untouched defaults survive the merge";
    };

    "xdg config is picked up when no path is given"_test = [] {
        ScratchDir dir;
        fs::create_directories(dir.path / "flamelabel");
        dir.write("flamelabel/config.yaml", "theme:\n  bar-height: 24\n");

        auto config = Config::create();
        expect(config.has_value());
        if (!config) return;
        expect((*config)->get<float>(Config::KEY_BAR_HEIGHT, 0.0f) == 24.0f);
    };

    "missing explicit file is an error"_test = [] {
        ScratchDir dir;
        auto config = Config::create((dir.path / "nope.yaml").string());
        expect(!config.has_value());
    };

    "malformed yaml is an error"_test = [] {
        ScratchDir dir;
        auto path = dir.write("bad.yaml", "theme: [unclosed\n");
        auto config = Config::create(path);
        expect(!config.has_value());
        if (config) return;
        expect(error_msg(config).find("YAML parse error") != std::string::npos)
            << error_msg(config);
    };

    "environment overrides file values"_test = [] {
        ScratchDir dir;
        auto path = dir.write("cfg.yaml", "theme:\n  font-size: 14\n");
        ::setenv("FLAMELABEL_THEME_FONT_SIZE", "13", 1);

        auto config = Config::create(path);
        ::unsetenv("FLAMELABEL_THEME_FONT_SIZE");

        expect(config.has_value());
        if (!config) return;
        expect((*config)->get<float>(Config::KEY_FONT_SIZE, 0.0f) == 13.0f);
    };

    "command line overrides beat the environment"_test = [] {
        ScratchDir dir;
        ::setenv("FLAMELABEL_THEME_DEVICE_PIXEL_RATIO", "3", 1);

        YAML::Node overrides;
        overrides["theme"]["device-pixel-ratio"] = 2;
        auto config = Config::create("", overrides);
        ::unsetenv("FLAMELABEL_THEME_DEVICE_PIXEL_RATIO");

        expect(config.has_value());
        if (!config) return;
        expect((*config)->get<float>(Config::KEY_DEVICE_PIXEL_RATIO, 0.0f) == 2.0f);
    };

    "override with a non-scalar key is an error"_test = [] {
        ScratchDir dir;
        YAML::Node badKey;
        badKey["nested"] = 1;
        YAML::Node overrides;
        overrides[badKey] = 5;

        auto config = Config::create("", overrides);
        expect(!config.has_value());
        if (config) return;
        expect(error_msg(config).find("Invalid config override") != std::string::npos)
            << error_msg(config);
    };

    "env var names follow the path"_test = [] {
        expect(Config::pathToEnvVar("theme/font-size") == "FLAMELABEL_THEME_FONT_SIZE");
        expect(Config::pathToEnvVar("theme.bar-padding") == "FLAMELABEL_THEME_BAR_PADDING");
    };

    "set creates intermediate maps"_test = [] {
        ScratchDir dir;
        auto config = Config::create();
        if (!config) return;
        (*config)->set("extra/nested/key", "value");
        expect((*config)->has("extra/nested/key"));
        expect((*config)->get<std::string>("extra.nested.key", "") == "value");
        expect(!(*config)->has("extra/nested/missing"));
    };

    "wrong type yields nullopt"_test = [] {
        ScratchDir dir;
        auto config = Config::create();
        if (!config) return;
        expect(!(*config)->get<float>(Config::KEY_FONT_FAMILY).has_value());
        expect(!(*config)->get<float>("theme").has_value()) << "maps are not scalars";
    };
};

suite color_tests = [] {

    "rgb and rgba forms"_test = [] {
        auto rgb = parseColor("#ff8000");
        expect(rgb.has_value());
        if (rgb) expect(*rgb == packColor(0xFF, 0x80, 0x00));

        auto rgba = parseColor("#11223344");
        expect(rgba.has_value());
        if (rgba) expect(*rgba == packColor(0x11, 0x22, 0x33, 0x44));

        auto upper = parseColor("#ABCDEF");
        expect(upper.has_value());
        if (upper) expect(*upper == packColor(0xAB, 0xCD, 0xEF));
    };

    "malformed colors are rejected"_test = [] {
        expect(!parseColor("").has_value());
        expect(!parseColor("ff0000").has_value());
        expect(!parseColor("#12345").has_value());
        expect(!parseColor("#gg0000").has_value());
    };

    "format is lowercase rgba"_test = [] {
        expect(formatColor(packColor(0xFF, 0x80, 0x00)) == "#ff8000ff");
    };
};

suite theme_tests = [] {

    "defaults match the built-in config"_test = [] {
        ScratchDir dir;
        auto config = Config::create();
        if (!config) return;
        auto theme = Theme::fromConfig(**config);
        expect(theme.has_value()) << error_msg(theme);
        if (!theme) return;

        Theme defaults;
        expect(theme->fontFamily == defaults.fontFamily);
        expect(theme->fontSize == defaults.fontSize);
        expect(theme->barHeight == defaults.barHeight);
        expect(theme->barPadding == defaults.barPadding);
        expect(theme->labelColor == defaults.labelColor);
        expect(theme->devicePixelRatio == defaults.devicePixelRatio);
        expect(theme->textCacheCapacity == defaults.textCacheCapacity);
    };

    "values are read from config"_test = [] {
        ScratchDir dir;
        auto path = dir.write("cfg.yaml",
            "theme:\n"
            "  font-family: DejaVu Sans\n"
            "  font-size: 12\n"
            "  bar-padding: 2.5\n"
            "  label-color: '#ffffff80'\n"
            "  text-cache-capacity: 4096\n");
        auto config = Config::create(path);
        if (!config) return;

        auto theme = Theme::fromConfig(**config);
        expect(theme.has_value()) << error_msg(theme);
        if (!theme) return;
        expect(theme->fontFamily == "DejaVu Sans");
        expect(theme->fontSize == 12.0f);
        expect(theme->barPadding == 2.5f);
        expect(theme->labelColor == packColor(0xFF, 0xFF, 0xFF, 0x80));
        expect(theme->textCacheCapacity == 4096u);
    };

    "invalid values are reported"_test = [] {
        ScratchDir dir;
        for (const char* body : {"theme:\n  font-size: 0\n",
                                 "theme:\n  font-size: big\n",
                                 "theme:\n  label-color: red\n",
                                 "theme:\n  text-cache-capacity: -1\n",
                                 "theme:\n  device-pixel-ratio: -2\n"}) {
            auto config = Config::create(dir.write("cfg.yaml", body));
            expect(config.has_value());
            if (!config) continue;
            expect(!Theme::fromConfig(**config).has_value()) << body;
        }
    };
};
