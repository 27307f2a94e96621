/**
 * @file geometry_cache_tests.cpp
 * @brief Explicitly owned geometry sharing between skins.
 */

#include <arfocus/skin/geometry_cache.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using arfocus::skin::GeometryCache;

namespace
{
    struct ArcGeometry
    {
        std::vector<double> vertices;
    };
} // namespace

TEST (GeometryCacheTests, BuildsOncePerKey)
{
    GeometryCache<ArcGeometry> cache;
    int builds = 0;
    const auto make = [&builds] {
        ++builds;
        return std::make_shared<ArcGeometry> (ArcGeometry{{0.0, 1.0}});
    };

    const auto a = cache.getOrCreate ("arc:0.17", make);
    const auto b = cache.getOrCreate ("arc:0.17", make);
    const auto c = cache.getOrCreate ("arc:0.25", make);

    EXPECT_EQ (a, b);
    EXPECT_NE (a, c);
    EXPECT_EQ (builds, 2);
    EXPECT_EQ (cache.size (), 2u);
}

TEST (GeometryCacheTests, ClearKeepsHandedOutGeometryAlive)
{
    GeometryCache<ArcGeometry> cache;
    auto held = cache.getOrCreate ("arc", [] { return std::make_shared<ArcGeometry> (ArcGeometry{{1.0, 2.0, 3.0}}); });
    cache.clear ();

    EXPECT_EQ (cache.size (), 0u);
    ASSERT_NE (held, nullptr);
    EXPECT_EQ (held->vertices.size (), 3u);

    // Rebuilt after clearing.
    const auto fresh = cache.getOrCreate ("arc", [] { return std::make_shared<ArcGeometry> (); });
    EXPECT_NE (fresh, held);
}

TEST (GeometryCacheTests, SeparateCachesDoNotShare)
{
    GeometryCache<ArcGeometry> first;
    GeometryCache<ArcGeometry> second;
    const auto make = [] { return std::make_shared<ArcGeometry> (); };
    EXPECT_NE (first.getOrCreate ("arc", make), second.getOrCreate ("arc", make));
}

TEST (GeometryCacheTests, FactoryMayReuseCachedParts)
{
    struct Composite
    {
        std::vector<std::shared_ptr<const ArcGeometry>> parts;
    };

    GeometryCache<ArcGeometry> arcs;
    GeometryCache<Composite> composites;
    const auto ring = [] { return std::make_shared<ArcGeometry> (ArcGeometry{{0.0, 0.5, 1.0}}); };

    // Composite built from a part of the same cache type, same cache.
    GeometryCache<ArcGeometry> shared;
    const auto outer = shared.getOrCreate ("arc:composite", [&] {
        const auto inner = shared.getOrCreate ("arc:ring", ring);
        return std::make_shared<ArcGeometry> (ArcGeometry{{inner->vertices.front (), inner->vertices.back ()}});
    });
    ASSERT_NE (outer, nullptr);
    EXPECT_EQ (outer->vertices.size (), 2u);
    EXPECT_EQ (shared.size (), 2u);

    const auto square = composites.getOrCreate ("square", [&] {
        auto c = std::make_shared<Composite> ();
        for (int i = 0; i < 4; ++i)
            c->parts.push_back (arcs.getOrCreate ("arc:ring", ring));
        return c;
    });
    EXPECT_EQ (square->parts.size (), 4u);
    EXPECT_EQ (square->parts.front (), square->parts.back ());
    EXPECT_EQ (arcs.size (), 1u);
}

TEST (GeometryCacheTests, FirstStoredEntryWins)
{
    GeometryCache<ArcGeometry> cache;
    std::shared_ptr<const ArcGeometry> early;

    // The factory races itself: an inner request for the same key stores first.
    const auto late = cache.getOrCreate ("arc", [&] {
        early = cache.getOrCreate ("arc", [] { return std::make_shared<ArcGeometry> (ArcGeometry{{1.0}}); });
        return std::make_shared<ArcGeometry> (ArcGeometry{{2.0}});
    });

    EXPECT_EQ (late, early);
    EXPECT_EQ (late->vertices, std::vector<double>{1.0});
    EXPECT_EQ (cache.size (), 1u);
}
