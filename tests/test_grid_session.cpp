#include <gtest/gtest.h>
#include "grid_session.hpp"
#include "errors.hpp"
#include <thread>

using namespace voxgrid;

namespace {

std::vector<Point> cube_points(double size) {
    std::vector<Point> pts;
    for (int n = 0; n < 1000; ++n) {
        double t = static_cast<double>(n) / 1000.0 * size;
        pts.emplace_back(t, size - t, t * 0.5);
    }
    return pts;
}

VoxelizeResult voxelize_for(GridSession& session, uint64_t generation,
                            const std::vector<Point>& pts, double voxel_size) {
    VoxelizeOptions options;
    options.is_cancelled = session.cancel_check(generation);
    VoxelizeResult result = voxelize(pts, voxel_size, std::nullopt, options);
    result.generation = generation;
    return result;
}

} // namespace

TEST(GridSessionTest, GenerationsIncrease) {
    GridSession session;
    EXPECT_EQ(session.generation(), 0u);
    uint64_t a = session.begin_request();
    uint64_t b = session.begin_request();
    EXPECT_LT(a, b);
    EXPECT_FALSE(session.is_current(a));
    EXPECT_TRUE(session.is_current(b));
}

TEST(GridSessionTest, PublishCurrentResult) {
    GridSession session;
    auto pts = cube_points(10.0);
    uint64_t gen = session.begin_request();

    EXPECT_EQ(session.current(), nullptr);
    EXPECT_TRUE(session.publish(voxelize_for(session, gen, pts, 1.0)));
    ASSERT_NE(session.current(), nullptr);
    EXPECT_EQ(session.current()->generation, gen);
}

TEST(GridSessionTest, StaleResultIsDiscarded) {
    GridSession session;
    auto pts = cube_points(10.0);

    uint64_t first = session.begin_request();
    VoxelizeResult stale = voxelize(pts, 1.0);
    stale.generation = first;

    uint64_t second = session.begin_request();
    VoxelizeResult fresh = voxelize_for(session, second, pts, 2.0);

    EXPECT_TRUE(session.publish(fresh));
    EXPECT_FALSE(session.publish(stale));

    // The newer grid stays installed
    auto current = session.current();
    ASSERT_NE(current, nullptr);
    EXPECT_EQ(current->generation, second);
    EXPECT_DOUBLE_EQ(current->grid->spec().voxel_size, 2.0);
}

TEST(GridSessionTest, SupersededRequestIsCancelled) {
    GridSession session;
    auto pts = cube_points(10.0);

    uint64_t first = session.begin_request();
    CancelCheck check = session.cancel_check(first);
    EXPECT_FALSE(check());

    session.begin_request();
    EXPECT_TRUE(check());
    EXPECT_THROW(voxelize_for(session, first, pts, 1.0), CancelledError);
}

TEST(GridSessionTest, ClearDropsResult) {
    GridSession session;
    uint64_t gen = session.begin_request();
    session.publish(voxelize_for(session, gen, cube_points(4.0), 1.0));
    ASSERT_NE(session.current(), nullptr);
    session.clear();
    EXPECT_EQ(session.current(), nullptr);
}

TEST(GridSessionTest, ReadersKeepGridAlive) {
    GridSession session;
    uint64_t gen = session.begin_request();
    session.publish(voxelize_for(session, gen, cube_points(4.0), 1.0));

    auto held = session.current();
    uint64_t next = session.begin_request();
    session.publish(voxelize_for(session, next, cube_points(8.0), 1.0));

    EXPECT_NE(held, session.current());
    EXPECT_EQ(held->generation, gen);
    EXPECT_GT(held->grid->total_count(), 0u);
}

TEST(GridSessionTest, ConcurrentRequestsKeepNewest) {
    GridSession session;
    auto pts = cube_points(20.0);

    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        uint64_t gen = session.begin_request();
        workers.emplace_back([&session, &pts, gen]() {
            try {
                session.publish(voxelize_for(session, gen, pts, 1.0));
            } catch (const CancelledError&) {
                // superseded before finishing
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }

    auto current = session.current();
    ASSERT_NE(current, nullptr);
    EXPECT_EQ(current->generation, session.generation());
}
