#pragma once

#include <flamelabel/flame-graph.h>
#include <flamelabel/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace flamelabel::tool {

struct StackNode {
    std::string name;
    uint64_t self = 0;
    uint64_t total = 0;
    std::vector<StackNode> children;
};

//=============================================================================
// CollapsedStacks - "a;b;c 42" sample lines merged into a call tree
//
// Lines starting with '#' and blank lines are ignored; lines without a
// trailing sample count are skipped and counted in skippedLines().
//=============================================================================
class CollapsedStacks {
public:
    CollapsedStacks();

    /// Parse and merge; may be called repeatedly to accumulate.
    void load(std::string_view data);
    Result<void> loadFile(const std::string& path);

    void clear();

    uint64_t totalSamples() const { return _root.total; }
    int maxDepth() const { return _maxDepth; }
    size_t skippedLines() const { return _skippedLines; }
    const StackNode& root() const { return _root; }

    /// Lay the tree out in sample units: siblings left to right, heaviest
    /// first, each frame as wide as its total sample count.
    FlameGraph toFlameGraph(bool inverted = false) const;

private:
    void mergeStack(const std::vector<std::string_view>& frames, uint64_t count);
    static void computeTotals(StackNode& node);

    StackNode _root;
    int _maxDepth = 0;
    size_t _skippedLines = 0;
};

} // namespace flamelabel::tool
