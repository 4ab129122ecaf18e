//=============================================================================
// flamelabel - render flamegraph labels for a collapsed-stack profile
//
//   flamelabel -f stacks.txt --font DejaVuSans.ttf [--width 1200] [--dpr 2]
//              [--left 0 --right 5000] [--inverted] [--config cfg.yaml]
//
// Prints the label spans of one render pass as YAML on stdout.
//=============================================================================

#include "collapsed-stacks.h"

#include <flamelabel/config.h>
#include <flamelabel/flame-text-renderer.h>
#include <flamelabel/font/raw-font-manager.h>
#include <flamelabel/geometry.h>
#include <flamelabel/label-buffer.h>
#include <flamelabel/theme.h>

#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <ytrace/ytrace.hpp>
#include <yaml-cpp/yaml.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace flamelabel;

namespace {

struct Options {
    std::string stacksPath;
    std::string fontPath;
    std::string configPath;
    double width = 1200.0;
    std::optional<double> height;
    std::optional<double> dpr;
    std::optional<double> left;
    std::optional<double> right;
    bool inverted = false;
};

Result<void> run(const Options& opts) {
    YAML::Node overrides(YAML::NodeType::Map);
    if (opts.dpr) {
        overrides["theme"]["device-pixel-ratio"] = *opts.dpr;
    }

    auto config = Config::create(opts.configPath, overrides);
    if (!config) return Err("cannot load configuration", config);

    auto theme = Theme::fromConfig(**config);
    if (!theme) return Err("invalid theme", theme);

    tool::CollapsedStacks stacks;
    if (auto res = stacks.loadFile(opts.stacksPath); !res) {
        return res;
    }
    if (stacks.totalSamples() == 0) {
        return Err("no samples in " + opts.stacksPath);
    }

    auto graph = std::make_shared<FlameGraph>(stacks.toFlameGraph(opts.inverted));
    yinfo("flamelabel: {} frames, {} samples, max depth {}",
          graph->frameCount(), stacks.totalSamples(), graph->maxDepth());

    auto fontManager = font::RawFontManager::instance();
    if (!fontManager) return Err("font manager unavailable", fontManager);

    auto font = (*fontManager)->createFromFile(opts.fontPath);
    if (!font) return Err("cannot load font", font);

    auto buffer = LabelBuffer::create(*font);
    if (!buffer) return Err("cannot create label buffer", buffer);
    (*buffer)->addFont(theme->fontFamily, *font);

    auto renderer = FlameTextRenderer::create(*buffer, graph, *theme);
    if (!renderer) return Err("cannot create renderer", renderer);

    const Rect configSpace = graph->configSpace();
    Rect configView = configSpace;
    configView.x = opts.left.value_or(configSpace.left());
    configView.width = opts.right.value_or(configSpace.right()) - configView.x;
    if (!(configView.width > 0.0)) {
        return Err("--right must be greater than --left");
    }

    const double dpr = theme->devicePixelRatio;
    const double physicalWidth = opts.width * dpr;
    const double physicalHeight = opts.height
        ? *opts.height * dpr
        : configSpace.height * theme->barHeight * dpr;

    const glm::dmat3 toPhysical = rectToRectTransform(
        configView, Rect{0.0, 0.0, physicalWidth, physicalHeight});

    (*renderer)->draw(configView, configSpace, toPhysical);

    const auto& stats = (*renderer)->lastStats();
    yinfo("flamelabel: visited {} drawn {} truncated {} culled {}/{}",
          stats.visited, stats.drawn, stats.truncated,
          stats.culledOutOfView, stats.culledTooNarrow);

    std::cout << (*buffer)->toYaml() << std::endl;
    return Ok();
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("flamelabel"));
    spdlog::set_level(spdlog::level::warn);

    args::ArgumentParser parser("flamelabel",
        "Render flamegraph frame labels for a collapsed-stack profile and print them as YAML.");
    parser.Prog("flamelabel");

    args::HelpFlag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> stacksFlag(parser, "file",
        "Collapsed stacks file (\"a;b;c 42\" per line)", {'f', "file"});
    args::ValueFlag<std::string> fontFlag(parser, "path",
        "TTF/OTF font used to measure labels", {"font"});
    args::ValueFlag<std::string> configFlag(parser, "path",
        "Config file (default: $XDG_CONFIG_HOME/flamelabel/config.yaml)", {'c', "config"});
    args::ValueFlag<double> widthFlag(parser, "px",
        "Viewport width in logical pixels", {'W', "width"}, 1200.0);
    args::ValueFlag<double> heightFlag(parser, "px",
        "Viewport height in logical pixels (default: one bar per row)", {'H', "height"});
    args::ValueFlag<double> dprFlag(parser, "ratio",
        "Device pixel ratio (overrides theme.device-pixel-ratio)", {"dpr"});
    args::ValueFlag<double> leftFlag(parser, "x",
        "Left edge of the visible range, in samples", {"left"});
    args::ValueFlag<double> rightFlag(parser, "x",
        "Right edge of the visible range, in samples", {"right"});
    args::Flag invertedFlag(parser, "inverted", "Draw as an icicle graph", {'i', "inverted"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }

    if (verboseFlag) {
        spdlog::set_level(spdlog::level::debug);
    }
    spdlog::cfg::load_env_levels();

    if (!stacksFlag || !fontFlag) {
        std::cerr << "flamelabel: --file and --font are required\n";
        std::cerr << parser;
        return 1;
    }

    Options opts;
    opts.stacksPath = args::get(stacksFlag);
    opts.fontPath = args::get(fontFlag);
    if (configFlag) opts.configPath = args::get(configFlag);
    opts.width = args::get(widthFlag);
    if (heightFlag) opts.height = args::get(heightFlag);
    if (dprFlag) opts.dpr = args::get(dprFlag);
    if (leftFlag) opts.left = args::get(leftFlag);
    if (rightFlag) opts.right = args::get(rightFlag);
    opts.inverted = invertedFlag;

    if (auto res = run(opts); !res) {
        yerror("flamelabel: {}", error_msg(res));
        return 1;
    }
    return 0;
}
