#include <flamelabel/text-metrics-cache.h>
#include <flamelabel/text-surface.h>

#include <ytrace/ytrace.hpp>

namespace flamelabel {

TextMetricsCache::TextMetricsCache(size_t capacity)
    : _capacity(capacity) {
}

float TextMetricsCache::measure(std::string_view text, TextSurface& surface) {
    if (text == SENTINEL) {
        if (_sentinelWidth) {
            ++_hits;
            return *_sentinelWidth;
        }
        ++_misses;
        _sentinelWidth = surface.measureText(text);
        return *_sentinelWidth;
    }

    if (auto it = _index.find(text); it != _index.end()) {
        ++_hits;
        _lru.splice(_lru.begin(), _lru, it->second);
        return it->second->width;
    }

    ++_misses;
    float width = surface.measureText(text);

    _lru.push_front(Entry{std::string(text), width});
    _index.emplace(std::string_view(_lru.front().text), _lru.begin());
    evictOverflow();
    return width;
}

bool TextMetricsCache::maybeInvalidate(TextSurface& surface) {
    if (!_sentinelWidth) {
        ++_misses;
        _sentinelWidth = surface.measureText(SENTINEL);
        return false;
    }

    ++_misses;
    float width = surface.measureText(SENTINEL);
    if (width == *_sentinelWidth) {
        return false;
    }

    ydebug("TextMetricsCache: sentinel width {} -> {}, dropping {} entries",
           *_sentinelWidth, width, _lru.size());
    _index.clear();
    _lru.clear();
    _sentinelWidth = width;
    ++_invalidations;
    return true;
}

void TextMetricsCache::invalidate() {
    ydebug("TextMetricsCache: invalidated, dropping {} entries", size());
    _index.clear();
    _lru.clear();
    _sentinelWidth.reset();
    ++_invalidations;
}

void TextMetricsCache::setCapacity(size_t capacity) {
    _capacity = capacity;
    evictOverflow();
}

bool TextMetricsCache::contains(std::string_view text) const {
    if (text == SENTINEL) return _sentinelWidth.has_value();
    return _index.find(text) != _index.end();
}

void TextMetricsCache::evictOverflow() {
    if (_capacity == 0) return;
    while (_lru.size() > _capacity) {
        _index.erase(std::string_view(_lru.back().text));
        _lru.pop_back();
    }
}

} // namespace flamelabel
