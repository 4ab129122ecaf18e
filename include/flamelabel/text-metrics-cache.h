#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace flamelabel {

class TextSurface;

//=============================================================================
// TextMetricsCache - memoized text widths for the active font
//
// The surface cannot report font or scale changes (late web-font swaps,
// DPI changes), so maybeInvalidate() re-measures a fixed sentinel string
// and drops every entry when its width moved.
//
// capacity == 0 keeps every entry; otherwise the least recently used entry
// is evicted on insert. The sentinel is kept outside the LRU list and is
// never evicted.
//=============================================================================
class TextMetricsCache {
public:
    static constexpr std::string_view SENTINEL =
        "Who knows if this changed, font-display: swap wont tell me";

    explicit TextMetricsCache(size_t capacity = 0);

    TextMetricsCache(const TextMetricsCache&) = delete;
    TextMetricsCache& operator=(const TextMetricsCache&) = delete;

    /// Cached width of text, measuring through the surface on a miss.
    float measure(std::string_view text, TextSurface& surface);

    /// Sentinel width check; run once before each render pass.
    /// Returns true when the cache was dropped.
    bool maybeInvalidate(TextSurface& surface);

    /// Drop everything, sentinel included.
    void invalidate();

    size_t size() const { return _lru.size() + (_sentinelWidth ? 1 : 0); }
    size_t capacity() const { return _capacity; }
    void setCapacity(size_t capacity);

    bool contains(std::string_view text) const;

    uint64_t hits() const { return _hits; }
    uint64_t misses() const { return _misses; }
    uint64_t invalidations() const { return _invalidations; }

private:
    struct Entry {
        std::string text;
        float width;
    };
    using List = std::list<Entry>;

    struct StringHash {
        using is_transparent = void;
        size_t operator()(std::string_view sv) const {
            return std::hash<std::string_view>{}(sv);
        }
    };

    // Keys view into the owning list node's string
    using Index = std::unordered_map<std::string_view, List::iterator,
                                     StringHash, std::equal_to<>>;

    void evictOverflow();

    size_t _capacity;
    List _lru;  // front = most recently used
    Index _index;
    std::optional<float> _sentinelWidth;

    uint64_t _hits = 0;
    uint64_t _misses = 0;
    uint64_t _invalidations = 0;
};

} // namespace flamelabel
