#include <flamelabel/flame-text-renderer.h>
#include <flamelabel/text-truncation.h>
#include <flamelabel/viewport-culler.h>

#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace flamelabel {

class FlameTextRendererImpl : public FlameTextRenderer {
public:
    FlameTextRendererImpl(TextSurface::Ptr surface,
                          std::shared_ptr<const FlameGraph> graph,
                          const Theme& theme)
        : _surface(std::move(surface))
        , _graph(std::move(graph))
        , _theme(theme)
        , _cache(theme.textCacheCapacity) {}

    Result<void> init() {
        if (!_surface) return Err("FlameTextRenderer: no text surface");
        if (!_graph) return Err("FlameTextRenderer: no flame graph");
        if (auto res = _theme.validate(); !res) {
            return Err("FlameTextRenderer: invalid theme", res);
        }
        return Ok();
    }

    void draw(const Rect& configViewSpace, const Rect& configSpace,
              const glm::dmat3& configViewToPhysicalSpace) override {
        _stats = {};
        TextSurface& surface = *_surface;
        const Theme& theme = _theme;
        const double dpr = theme.devicePixelRatio;

        surface.setFont(theme.fontFamily, static_cast<float>(theme.fontSize * dpr));
        surface.setTextBaseline(TextBaseline::Alphabetic);
        surface.setFillColor(theme.labelColor);

        // Check the sentinel after setFont so a theme or DPI change is seen this pass
        _cache.maybeInvalidate(surface);

        auto measure = [this, &surface](std::string_view text) -> double {
            return _cache.measure(text, surface);
        };

        const double minWidth = measure(ELLIPSIS);
        const double sidePadding = 2.0 * theme.barPadding * dpr;
        const double halfSidePadding = sidePadding / 2.0;
        const double baselineOffset = (theme.barHeight - theme.fontSize / 2.0) * dpr;
        const double baseline = _graph->inverted() ? configSpace.height - 1.0 : 0.0;

        const double viewLeft = configViewSpace.left();
        const double viewRight = configViewSpace.right();

        _stack.clear();
        const auto& roots = _graph->roots();
        for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
            _stack.push_back(*it);
        }

        while (!_stack.empty()) {
            const FlameFrame* frame = _stack.back();
            _stack.pop_back();
            ++_stats.visited;

            if (!intersectsViewport(frame->start, frame->end, configViewSpace)) {
                ++_stats.culledOutOfView;
                continue;
            }

            // Pin to the viewport so labels of wide frames stay visible while panning
            const double pinnedStart = std::max(frame->start, viewLeft);
            const double pinnedEnd = std::min(frame->end, viewRight);
            const double depth = std::abs(baseline - static_cast<double>(frame->depth));

            const Rect physical = projectFrameRect(pinnedStart, depth,
                                                   pinnedEnd - pinnedStart,
                                                   configViewToPhysicalSpace);
            const double paddedWidth = physical.width - sidePadding;

            if (!std::isfinite(physical.x) || !std::isfinite(physical.y) ||
                !std::isfinite(paddedWidth) ||
                !wideEnoughForLabel(paddedWidth, minWidth)) {
                ++_stats.culledTooNarrow;
                continue;
            }

            if (fitLabel(frame->name, paddedWidth, measure, _label)) {
                ++_stats.truncated;
            }
            surface.fillText(_label,
                             static_cast<float>(physical.x + halfSidePadding),
                             static_cast<float>(physical.y + baselineOffset));
            ++_stats.drawn;

            for (auto it = frame->children.rbegin(); it != frame->children.rend(); ++it) {
                _stack.push_back(*it);
            }
        }

        ydebug("FlameTextRenderer: visited={} outOfView={} tooNarrow={} drawn={} truncated={} cache={}",
               _stats.visited, _stats.culledOutOfView, _stats.culledTooNarrow,
               _stats.drawn, _stats.truncated, _cache.size());
    }

    Result<void> setTheme(const Theme& theme) override {
        if (auto res = theme.validate(); !res) {
            return Err("FlameTextRenderer: invalid theme", res);
        }
        bool fontChanged = theme.fontFamily != _theme.fontFamily ||
                           theme.fontSize != _theme.fontSize ||
                           theme.devicePixelRatio != _theme.devicePixelRatio;
        _theme = theme;
        _cache.setCapacity(theme.textCacheCapacity);
        if (fontChanged) {
            _cache.invalidate();
        }
        return Ok();
    }

    const Theme& theme() const override { return _theme; }

    void setFlameGraph(std::shared_ptr<const FlameGraph> graph) override {
        if (!graph) {
            ywarn("FlameTextRenderer: ignoring null flame graph");
            return;
        }
        _graph = std::move(graph);
    }

    const Stats& lastStats() const override { return _stats; }
    TextMetricsCache& textCache() override { return _cache; }

private:
    TextSurface::Ptr _surface;
    std::shared_ptr<const FlameGraph> _graph;
    Theme _theme;
    TextMetricsCache _cache;
    Stats _stats;

    // Reused across passes
    std::vector<const FlameFrame*> _stack;
    std::string _label;
};

Result<FlameTextRenderer::Ptr> FlameTextRenderer::createImpl(
    TextSurface::Ptr surface, std::shared_ptr<const FlameGraph> graph, const Theme& theme) {
    auto impl = Ptr(new FlameTextRendererImpl(std::move(surface), std::move(graph), theme));
    if (auto res = static_cast<FlameTextRendererImpl*>(impl.get())->init(); !res) {
        return Err<Ptr>("FlameTextRenderer creation failed", res);
    }
    return Ok(std::move(impl));
}

} // namespace flamelabel
