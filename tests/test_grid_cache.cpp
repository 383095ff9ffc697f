#include <gtest/gtest.h>
#include "grid_cache.hpp"
#include "errors.hpp"
#include <cmath>
#include <limits>

using namespace voxgrid;

namespace {

std::shared_ptr<const VoxelizeResult> make_result(double voxel_size) {
    std::vector<Point> pts = {{0, 0, 0}, {4, 4, 4}};
    return std::make_shared<const VoxelizeResult>(voxelize(pts, voxel_size));
}

} // namespace

TEST(GridCacheTest, ZeroCapacityThrows) {
    EXPECT_THROW(GridCache(0), InvalidInputError);
}

TEST(GridCacheTest, MissThenHit) {
    GridCache cache(4);
    GridCacheKey key(1, 1.0);
    EXPECT_EQ(cache.find(key), nullptr);

    auto result = make_result(1.0);
    cache.insert(key, result);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.find(key), result);
}

TEST(GridCacheTest, KeyIncludesVoxelSizeAndBounds) {
    GridCache cache(8);
    BBox bounds(Vec3d(0, 0, 0), Vec3d(10, 10, 10));
    cache.insert(GridCacheKey(1, 1.0), make_result(1.0));

    EXPECT_EQ(cache.find(GridCacheKey(1, 2.0)), nullptr);
    EXPECT_EQ(cache.find(GridCacheKey(2, 1.0)), nullptr);
    EXPECT_EQ(cache.find(GridCacheKey(1, 1.0, bounds)), nullptr);

    cache.insert(GridCacheKey(1, 1.0, bounds), make_result(1.0));
    EXPECT_NE(cache.find(GridCacheKey(1, 1.0, bounds)), nullptr);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(GridCacheTest, NonFiniteKeyThrows) {
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(GridCacheKey(1, std::nan("")), InvalidInputError);
    EXPECT_THROW(GridCacheKey(1, inf), InvalidInputError);
    EXPECT_THROW(GridCacheKey(1, 1.0, BBox(Vec3d(0, 0, 0), Vec3d(std::nan(""), 1, 1))),
                 InvalidInputError);
    EXPECT_NO_THROW(GridCacheKey(1, 1.0, BBox(Vec3d(0, 0, 0), Vec3d(1, 1, 1))));
}

TEST(GridCacheTest, EvictsLeastRecentlyUsed) {
    GridCache cache(2);
    cache.insert(GridCacheKey(1, 1.0), make_result(1.0));
    cache.insert(GridCacheKey(2, 1.0), make_result(1.0));

    // Touch 1 so that 2 becomes the oldest
    EXPECT_NE(cache.find(GridCacheKey(1, 1.0)), nullptr);

    cache.insert(GridCacheKey(3, 1.0), make_result(1.0));
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_NE(cache.find(GridCacheKey(1, 1.0)), nullptr);
    EXPECT_EQ(cache.find(GridCacheKey(2, 1.0)), nullptr);
    EXPECT_NE(cache.find(GridCacheKey(3, 1.0)), nullptr);
}

TEST(GridCacheTest, ReinsertReplacesEntry) {
    GridCache cache(2);
    cache.insert(GridCacheKey(1, 1.0), make_result(1.0));
    auto replacement = make_result(1.0);
    cache.insert(GridCacheKey(1, 1.0), replacement);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.find(GridCacheKey(1, 1.0)), replacement);
}

TEST(GridCacheTest, InvalidateByPointSet) {
    GridCache cache(8);
    cache.insert(GridCacheKey(1, 1.0), make_result(1.0));
    cache.insert(GridCacheKey(1, 2.0), make_result(2.0));
    cache.insert(GridCacheKey(2, 1.0), make_result(1.0));

    EXPECT_EQ(cache.invalidate(1), 2u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_NE(cache.find(GridCacheKey(2, 1.0)), nullptr);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(GridCacheTest, EvictedResultStaysValidForHolders) {
    GridCache cache(1);
    cache.insert(GridCacheKey(1, 1.0), make_result(1.0));
    auto held = cache.find(GridCacheKey(1, 1.0));
    cache.insert(GridCacheKey(2, 1.0), make_result(1.0));

    EXPECT_EQ(cache.find(GridCacheKey(1, 1.0)), nullptr);
    ASSERT_NE(held, nullptr);
    EXPECT_EQ(held->grid->total_count(), 2u);
}

TEST(HashPointsTest, SensitiveToContent) {
    std::vector<Point> a = {{0, 0, 0}, {1, 2, 3}};
    std::vector<Point> b = a;
    EXPECT_EQ(hash_points(a), hash_points(b));

    b[1].pos.z = 3.0000001;
    EXPECT_NE(hash_points(a), hash_points(b));

    std::vector<Point> c = a;
    c[0].category = Category::Road;
    EXPECT_NE(hash_points(a), hash_points(c));

    std::vector<Point> d = a;
    d[0].intensity = 1.0;
    EXPECT_NE(hash_points(a), hash_points(d));

    std::vector<Point> e = {a[1], a[0]};
    EXPECT_NE(hash_points(a), hash_points(e));
}
