#include "collapsed-stacks.h"

#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

namespace flamelabel::tool {

CollapsedStacks::CollapsedStacks() {
    _root.name = "root";
}

//=============================================================================
// Parsing
//=============================================================================

void CollapsedStacks::load(std::string_view data) {
    std::vector<std::string_view> frames;

    while (!data.empty()) {
        auto eol = data.find('\n');
        std::string_view line = data.substr(0, eol);
        data.remove_prefix(eol == std::string_view::npos ? data.size() : eol + 1);

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.empty() || line[0] == '#') continue;

        auto lastSpace = line.rfind(' ');
        if (lastSpace == std::string_view::npos) {
            ++_skippedLines;
            continue;
        }

        std::string_view countStr = line.substr(lastSpace + 1);
        uint64_t count = 0;
        auto [ptr, ec] = std::from_chars(countStr.data(), countStr.data() + countStr.size(), count);
        if (ec != std::errc() || ptr != countStr.data() + countStr.size()) {
            ++_skippedLines;
            continue;
        }

        frames.clear();
        std::string_view stack = line.substr(0, lastSpace);
        while (!stack.empty()) {
            auto semi = stack.find(';');
            std::string_view frame = stack.substr(0, semi);
            if (!frame.empty()) frames.push_back(frame);
            stack.remove_prefix(semi == std::string_view::npos ? stack.size() : semi + 1);
        }

        if (!frames.empty()) {
            mergeStack(frames, count);
        }
    }

    computeTotals(_root);
    if (_skippedLines > 0) {
        ywarn("CollapsedStacks: skipped {} malformed lines", _skippedLines);
    }
}

Result<void> CollapsedStacks::loadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err("CollapsedStacks: cannot open " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Err("CollapsedStacks: read error on " + path);
    }
    load(ss.str());
    ydebug("CollapsedStacks: {} samples, max depth {} from {}",
           totalSamples(), maxDepth(), path);
    return Ok();
}

void CollapsedStacks::clear() {
    _root.children.clear();
    _root.self = 0;
    _root.total = 0;
    _maxDepth = 0;
    _skippedLines = 0;
}

void CollapsedStacks::mergeStack(const std::vector<std::string_view>& frames,
                                 uint64_t count) {
    StackNode* current = &_root;

    for (size_t i = 0; i < frames.size(); i++) {
        std::string_view name = frames[i];

        auto it = std::find_if(current->children.begin(), current->children.end(),
                               [&](const StackNode& child) { return child.name == name; });
        if (it == current->children.end()) {
            current->children.push_back({std::string(name), 0, 0, {}});
            it = current->children.end() - 1;
        }

        if (i == frames.size() - 1) {
            it->self += count;
        }

        current = &*it;
    }

    int depth = static_cast<int>(frames.size());
    if (depth > _maxDepth) _maxDepth = depth;
}

void CollapsedStacks::computeTotals(StackNode& node) {
    node.total = node.self;
    for (auto& child : node.children) {
        computeTotals(child);
        node.total += child.total;
    }

    std::stable_sort(node.children.begin(), node.children.end(),
                     [](const StackNode& a, const StackNode& b) {
                         return a.total > b.total;
                     });
}

//=============================================================================
// Layout
//=============================================================================

namespace {

void layoutChildren(FlameGraph& graph, FlameFrame& parent, const StackNode& node) {
    double x = parent.start;
    for (const auto& child : node.children) {
        double w = static_cast<double>(child.total);
        FlameFrame& frame = graph.addChild(parent, child.name, x, x + w);
        layoutChildren(graph, frame, child);
        x += w;
    }
}

} // namespace

FlameGraph CollapsedStacks::toFlameGraph(bool inverted) const {
    FlameGraph graph;
    graph.setInverted(inverted);

    double x = 0.0;
    for (const auto& top : _root.children) {
        double w = static_cast<double>(top.total);
        FlameFrame& frame = graph.addRoot(top.name, x, x + w);
        layoutChildren(graph, frame, top);
        x += w;
    }
    return graph;
}

} // namespace flamelabel::tool
