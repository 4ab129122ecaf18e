#pragma once

#include <flamelabel/geometry.h>
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace flamelabel {

//=============================================================================
// FlameFrame - one stack frame in config space
//
// [start, end) is horizontal config space, depth is the row (0 = root row).
// Children lie inside the parent's interval, ordered left to right.
//=============================================================================
struct FlameFrame {
    std::string name;
    double start = 0.0;
    double end = 0.0;
    int depth = 0;
    std::vector<const FlameFrame*> children;

    double width() const { return end - start; }
};

//=============================================================================
// FlameGraph - owns the frame tree
//
// Frames live in a deque so references stay valid as the tree grows.
//=============================================================================
class FlameGraph {
public:
    FlameGraph() = default;

    FlameGraph(const FlameGraph&) = delete;
    FlameGraph& operator=(const FlameGraph&) = delete;
    FlameGraph(FlameGraph&&) = default;
    FlameGraph& operator=(FlameGraph&&) = default;

    FlameFrame& addRoot(std::string name, double start, double end);
    FlameFrame& addChild(FlameFrame& parent, std::string name, double start, double end);

    const std::vector<const FlameFrame*>& roots() const { return _roots; }
    size_t frameCount() const { return _frames.size(); }
    bool empty() const { return _frames.empty(); }

    /// Deepest depth in the tree (0 when only roots or empty).
    int maxDepth() const { return _maxDepth; }

    /// Inverted graphs grow downwards from the last row ("icicle").
    bool inverted() const { return _inverted; }
    void setInverted(bool inverted) { _inverted = inverted; }

    /// x/width span all frames, height = maxDepth + 1 rows.
    Rect configSpace() const;

private:
    FlameFrame& store(std::string name, double start, double end, int depth);

    std::deque<FlameFrame> _frames;
    std::vector<const FlameFrame*> _roots;
    double _minStart = 0.0;
    double _maxEnd = 0.0;
    int _maxDepth = 0;
    bool _inverted = false;
};

} // namespace flamelabel
