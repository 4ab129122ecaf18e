//=============================================================================
// TextMetricsCache Unit Tests
//
// Memoization, sentinel-driven invalidation, explicit invalidation and
// LRU eviction.
//=============================================================================

#include <cstddef>
#include <version>

#include <boost/ut.hpp>

#include <flamelabel/text-metrics-cache.h>
#include "../harness/fake_text_surface.h"

using namespace boost::ut;
using namespace flamelabel;
using flamelabel::test::FakeTextSurface;

suite text_metrics_cache_tests = [] {

    "hit returns cached width without measuring"_test = [] {
        auto surface = FakeTextSurface::make();
        TextMetricsCache cache;

        float first = cache.measure("main", *surface);
        float second = cache.measure("main", *surface);

        expect(first == 40.0f);
        expect(second == first);
        expect(surface->measureCalls == 1u);
        expect(cache.hits() == 1u);
        expect(cache.misses() == 1u);
    };

    "distinct strings are measured separately"_test = [] {
        auto surface = FakeTextSurface::make();
        TextMetricsCache cache;

        expect(cache.measure("a", *surface) == 10.0f);
        expect(cache.measure("abc", *surface) == 30.0f);
        expect(cache.size() == 2u);
        expect(surface->measureCalls == 2u);
    };

    "first check seeds the sentinel"_test = [] {
        auto surface = FakeTextSurface::make();
        TextMetricsCache cache;

        expect(!cache.maybeInvalidate(*surface));
        expect(cache.contains(TextMetricsCache::SENTINEL));
        expect(cache.size() == 1u);
        expect(cache.invalidations() == 0u);
    };

    "unchanged sentinel keeps entries"_test = [] {
        auto surface = FakeTextSurface::make();
        TextMetricsCache cache;

        cache.maybeInvalidate(*surface);
        cache.measure("foo", *surface);
        expect(!cache.maybeInvalidate(*surface));
        expect(cache.contains("foo"));

        uint64_t before = surface->measureCalls;
        cache.measure("foo", *surface);
        expect(surface->measureCalls == before);
    };

    "sentinel change drops every entry"_test = [] {
        auto surface = FakeTextSurface::make();
        TextMetricsCache cache;

        cache.maybeInvalidate(*surface);
        expect(cache.measure("foo", *surface) == 30.0f);
        cache.measure("bar", *surface);

        surface->charWidth = 12.0f;
        expect(cache.maybeInvalidate(*surface));
        expect(cache.invalidations() == 1u);
        expect(cache.size() == 1u) << "only the reseeded sentinel survives";
        expect(!cache.contains("foo"));

        uint64_t before = surface->measureCalls;
        expect(cache.measure("foo", *surface) == 36.0f);
        expect(surface->measureCalls == before + 1);
    };

    "explicit invalidate clears everything"_test = [] {
        auto surface = FakeTextSurface::make();
        TextMetricsCache cache;

        cache.maybeInvalidate(*surface);
        cache.measure("foo", *surface);
        cache.invalidate();

        expect(cache.size() == 0u);
        expect(!cache.contains(TextMetricsCache::SENTINEL));
        expect(cache.invalidations() == 1u);

        // Next check reseeds instead of comparing
        expect(!cache.maybeInvalidate(*surface));
        expect(cache.size() == 1u);
    };

    "bounded cache evicts least recently used"_test = [] {
        auto surface = FakeTextSurface::make();
        TextMetricsCache cache(2);

        cache.measure("a", *surface);
        cache.measure("b", *surface);
        cache.measure("a", *surface);  // a is now most recent
        cache.measure("c", *surface);

        expect(cache.contains("a"));
        expect(!cache.contains("b"));
        expect(cache.contains("c"));
        expect(cache.size() == 2u);
    };

    "sentinel is never evicted"_test = [] {
        auto surface = FakeTextSurface::make();
        TextMetricsCache cache(1);

        cache.maybeInvalidate(*surface);
        cache.measure("a", *surface);
        cache.measure("b", *surface);

        expect(cache.contains(TextMetricsCache::SENTINEL));
        expect(!cache.contains("a"));
        expect(cache.contains("b"));
        expect(cache.size() == 2u);
    };

    "shrinking capacity evicts immediately"_test = [] {
        auto surface = FakeTextSurface::make();
        TextMetricsCache cache;

        cache.measure("a", *surface);
        cache.measure("b", *surface);
        cache.measure("c", *surface);
        cache.setCapacity(1);

        expect(cache.size() == 1u);
        expect(cache.contains("c"));
    };

    "unbounded cache keeps everything"_test = [] {
        auto surface = FakeTextSurface::make();
        TextMetricsCache cache(0);

        for (int i = 0; i < 1000; ++i) {
            cache.measure(std::to_string(i), *surface);
        }
        expect(cache.size() == 1000u);
    };
};
