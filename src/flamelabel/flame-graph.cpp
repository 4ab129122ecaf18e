#include <flamelabel/flame-graph.h>

#include <algorithm>

namespace flamelabel {

FlameFrame& FlameGraph::store(std::string name, double start, double end, int depth) {
    if (_frames.empty()) {
        _minStart = start;
        _maxEnd = end;
    } else {
        _minStart = std::min(_minStart, start);
        _maxEnd = std::max(_maxEnd, end);
    }
    _maxDepth = std::max(_maxDepth, depth);

    FlameFrame& frame = _frames.emplace_back();
    frame.name = std::move(name);
    frame.start = start;
    frame.end = end;
    frame.depth = depth;
    return frame;
}

FlameFrame& FlameGraph::addRoot(std::string name, double start, double end) {
    FlameFrame& frame = store(std::move(name), start, end, 0);
    _roots.push_back(&frame);
    return frame;
}

FlameFrame& FlameGraph::addChild(FlameFrame& parent, std::string name,
                                 double start, double end) {
    FlameFrame& frame = store(std::move(name), start, end, parent.depth + 1);
    parent.children.push_back(&frame);
    return frame;
}

Rect FlameGraph::configSpace() const {
    if (_frames.empty()) return Rect{};
    return Rect{_minStart, 0.0, _maxEnd - _minStart, static_cast<double>(_maxDepth + 1)};
}

} // namespace flamelabel
