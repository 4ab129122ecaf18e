#pragma once

#include <flamelabel/base/object.h>
#include <flamelabel/base/factory.h>
#include <flamelabel/flame-graph.h>
#include <flamelabel/geometry.h>
#include <flamelabel/result.hpp>
#include <flamelabel/text-metrics-cache.h>
#include <flamelabel/text-surface.h>
#include <flamelabel/theme.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>

namespace flamelabel {

//=============================================================================
// FlameTextRenderer - draws the frame labels of a flamegraph
//
// Each draw() walks the frame tree in pre-order, culls frames outside the
// viewport or too narrow for an ellipsis (with their whole subtree), and
// center-elides every remaining label to the visible part of its bar.
// Widths are memoized in a TextMetricsCache owned by the renderer.
//
// Single-threaded; one draw() must finish before the next starts.
//=============================================================================
class FlameTextRenderer : public base::Object,
                          public base::ObjectFactory<FlameTextRenderer> {
public:
    using Ptr = std::shared_ptr<FlameTextRenderer>;

    struct Stats {
        uint32_t visited = 0;
        uint32_t culledOutOfView = 0;
        uint32_t culledTooNarrow = 0;
        uint32_t drawn = 0;
        uint32_t truncated = 0;
    };

    static Result<Ptr> createImpl(TextSurface::Ptr surface,
                                  std::shared_ptr<const FlameGraph> graph,
                                  const Theme& theme);

    ~FlameTextRenderer() override = default;
    const char* typeName() const override { return "FlameTextRenderer"; }

    /// configViewSpace: visible part of config space.
    /// configSpace: full extent of the graph (its height sets the inverted baseline).
    /// configViewToPhysicalSpace: config-view units -> physical pixels.
    virtual void draw(const Rect& configViewSpace, const Rect& configSpace,
                      const glm::dmat3& configViewToPhysicalSpace) = 0;

    /// Replaces the theme for later passes. A different font or pixel
    /// ratio drops the text cache.
    virtual Result<void> setTheme(const Theme& theme) = 0;
    virtual const Theme& theme() const = 0;

    virtual void setFlameGraph(std::shared_ptr<const FlameGraph> graph) = 0;

    virtual const Stats& lastStats() const = 0;
    virtual TextMetricsCache& textCache() = 0;

protected:
    FlameTextRenderer() = default;
};

} // namespace flamelabel
