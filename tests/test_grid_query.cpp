#include <gtest/gtest.h>
#include "grid_query.hpp"
#include "voxelizer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <numeric>
#include <random>

using namespace voxgrid;

namespace {

// dims (2, 3, 4) with count = linear index + 1
std::shared_ptr<const VoxelGrid> make_ramp_grid() {
    GridSpec spec = GridSpec::from_bounds(BBox(Vec3d(0, 0, 0), Vec3d(2, 3, 4)), 1.0);
    std::vector<uint32_t> counts(spec.cell_count());
    std::iota(counts.begin(), counts.end(), 1u);
    return std::make_shared<const VoxelGrid>(spec, std::move(counts));
}

std::shared_ptr<const VoxelGrid> make_random_grid(uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(0.0, 6.0);
    std::vector<Point> pts;
    for (int n = 0; n < 800; ++n) {
        double x = dist(rng);
        double y = dist(rng) * 0.5;
        double z = dist(rng) * 1.5;
        pts.emplace_back(x, y, z);
    }
    return voxelize(pts, 1.0, BBox(Vec3d(0, 0, 0), Vec3d(6, 3, 9))).grid;
}

// A row of n cells along x, every count = 1
std::shared_ptr<const VoxelGrid> make_row_grid(size_t n) {
    GridSpec spec = GridSpec::from_bounds(
        BBox(Vec3d(0, 0, 0), Vec3d(static_cast<double>(n), 1, 1)), 1.0);
    return std::make_shared<const VoxelGrid>(spec, std::vector<uint32_t>(n, 1));
}

} // namespace

TEST(GridQueryTest, NullGridThrows) {
    EXPECT_THROW(GridQuery(nullptr), InvalidInputError);
}

TEST(GridQueryTest, SliceShapes) {
    GridQuery query(make_ramp_grid());

    Plane x = query.slice(Axis::X, 0);
    EXPECT_EQ(x.row_axis, Axis::Y);
    EXPECT_EQ(x.col_axis, Axis::Z);
    EXPECT_EQ(x.rows, 3u);
    EXPECT_EQ(x.cols, 4u);

    Plane y = query.slice(Axis::Y, 0);
    EXPECT_EQ(y.row_axis, Axis::X);
    EXPECT_EQ(y.col_axis, Axis::Z);
    EXPECT_EQ(y.rows, 2u);
    EXPECT_EQ(y.cols, 4u);

    Plane z = query.slice(Axis::Z, 0);
    EXPECT_EQ(z.row_axis, Axis::X);
    EXPECT_EQ(z.col_axis, Axis::Y);
    EXPECT_EQ(z.rows, 2u);
    EXPECT_EQ(z.cols, 3u);
}

TEST(GridQueryTest, SliceValues) {
    auto grid = make_ramp_grid();
    GridQuery query(grid);

    Plane z = query.slice(Axis::Z, 2);
    for (size_t i = 0; i < 2; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            EXPECT_EQ(z.at(i, j), grid->count(i, j, 2));
        }
    }

    Plane x = query.slice(Axis::X, 1);
    EXPECT_EQ(x.at(2, 3), grid->count(1, 2, 3));
}

TEST(GridQueryTest, SlicesReconstructGrid) {
    auto grid = make_random_grid(1);
    GridQuery query(grid);
    const auto& dims = grid->dims();

    for (int a = 0; a < 3; ++a) {
        const Axis axis = static_cast<Axis>(a);
        for (size_t t = 0; t < dims[a]; ++t) {
            Plane p = query.slice(axis, t);
            for (size_t r = 0; r < p.rows; ++r) {
                for (size_t c = 0; c < p.cols; ++c) {
                    size_t idx[3];
                    idx[a] = t;
                    idx[axis_index(p.row_axis)] = r;
                    idx[axis_index(p.col_axis)] = c;
                    ASSERT_EQ(p.at(r, c), grid->count(idx[0], idx[1], idx[2]));
                }
            }
        }
    }
}

TEST(GridQueryTest, SliceIndexOutOfRange) {
    GridQuery query(make_ramp_grid());
    EXPECT_NO_THROW(query.slice(Axis::Z, 3));
    EXPECT_THROW(query.slice(Axis::Z, 4), OutOfRangeError);
    EXPECT_THROW(query.slice(Axis::X, 2), OutOfRangeError);
}

TEST(GridQueryTest, ProjectionMatchesBruteForce) {
    auto grid = make_random_grid(2);
    GridQuery query(grid);
    const auto& dims = grid->dims();

    Plane mip = query.max_intensity_projection(Axis::Y);
    ASSERT_EQ(mip.rows, dims[0]);
    ASSERT_EQ(mip.cols, dims[2]);
    for (size_t i = 0; i < dims[0]; ++i) {
        for (size_t k = 0; k < dims[2]; ++k) {
            uint32_t best = 0;
            for (size_t j = 0; j < dims[1]; ++j) {
                best = std::max(best, grid->count(i, j, k));
            }
            EXPECT_EQ(mip.at(i, k), best);
        }
    }
}

TEST(GridQueryTest, ProjectionDominatesEverySlice) {
    auto grid = make_random_grid(3);
    GridQuery query(grid);

    for (int a = 0; a < 3; ++a) {
        const Axis axis = static_cast<Axis>(a);
        Plane mip = query.max_intensity_projection(axis);
        for (size_t t = 0; t < grid->dims()[a]; ++t) {
            Plane s = query.slice(axis, t);
            for (size_t n = 0; n < s.values.size(); ++n) {
                ASSERT_GE(mip.values[n], s.values[n]);
            }
        }
    }
}

TEST(GridQueryTest, ProjectionOfRampIsLastLayer) {
    auto grid = make_ramp_grid();
    GridQuery query(grid);
    Plane mip = query.max_intensity_projection(Axis::X);
    for (size_t j = 0; j < 3; ++j) {
        for (size_t k = 0; k < 4; ++k) {
            EXPECT_EQ(mip.at(j, k), grid->count(1, j, k));
        }
    }
    EXPECT_EQ(mip.max_value(), 24u);
}

TEST(GridQueryTest, CapSelectsEvenlySpacedOrdinals) {
    GridQuery query(make_row_grid(50));

    auto pts = query.thresholded_points(0.0, 5);
    ASSERT_EQ(pts.size(), 5u);
    const size_t expected[] = {0, 10, 20, 30, 40};
    for (size_t m = 0; m < 5; ++m) {
        EXPECT_EQ(pts[m].index[0], expected[m]);
    }
}

TEST(GridQueryTest, CapAtLeastCountReturnsAllInOrder) {
    auto grid = make_random_grid(4);
    GridQuery query(grid);

    const size_t qualifying = query.count_above(2.0);
    auto pts = query.thresholded_points(2.0, qualifying + 10);
    ASSERT_EQ(pts.size(), qualifying);

    const GridSpec& spec = grid->spec();
    for (size_t n = 1; n < pts.size(); ++n) {
        EXPECT_LT(spec.linear_index(pts[n - 1].index[0], pts[n - 1].index[1], pts[n - 1].index[2]),
                  spec.linear_index(pts[n].index[0], pts[n].index[1], pts[n].index[2]));
    }
    for (const auto& p : pts) {
        EXPECT_GT(p.value, 2u);
    }
}

TEST(GridQueryTest, ThresholdIsStrict) {
    GridQuery query(make_ramp_grid());
    // Values 1..24; 24 - 20 = 4 cells exceed 20
    EXPECT_EQ(query.count_above(20.0), 4u);
    auto pts = query.thresholded_points(20.0, 100);
    ASSERT_EQ(pts.size(), 4u);
    EXPECT_EQ(pts.front().value, 21u);
}

TEST(GridQueryTest, ThresholdBelowMinimumSelectsAllCells) {
    auto grid = make_random_grid(9);
    GridQuery query(grid);
    const size_t n = grid->size();
    ASSERT_GT(n, 5u);

    EXPECT_EQ(query.count_above(-1.0), n);
    auto all = query.thresholded_points(-1.0, n);
    ASSERT_EQ(all.size(), n);
    const GridSpec& spec = grid->spec();
    for (size_t m = 0; m < n; ++m) {
        EXPECT_EQ(spec.linear_index(all[m].index[0], all[m].index[1], all[m].index[2]), m);
    }

    auto capped = query.thresholded_points(-1.0, 5);
    ASSERT_EQ(capped.size(), 5u);
    for (size_t m = 0; m < 5; ++m) {
        EXPECT_EQ(spec.linear_index(capped[m].index[0], capped[m].index[1], capped[m].index[2]),
                  m * n / 5);
    }
}

TEST(GridQueryTest, QueriesAreRepeatable) {
    auto grid = make_random_grid(11);
    const std::vector<uint32_t> before = grid->counts();
    GridQuery query(grid);

    for (int a = 0; a < 3; ++a) {
        const Axis axis = static_cast<Axis>(a);
        Plane s1 = query.slice(axis, 1);
        Plane s2 = query.slice(axis, 1);
        EXPECT_EQ(s1.values, s2.values);

        Plane m1 = query.max_intensity_projection(axis);
        Plane m2 = query.max_intensity_projection(axis);
        EXPECT_EQ(m1.values, m2.values);
    }

    auto p1 = query.thresholded_points(1.0, 20);
    auto p2 = query.thresholded_points(1.0, 20);
    ASSERT_EQ(p1.size(), p2.size());
    for (size_t n = 0; n < p1.size(); ++n) {
        EXPECT_EQ(p1[n].index, p2[n].index);
        EXPECT_EQ(p1[n].value, p2[n].value);
        EXPECT_EQ(p1[n].center, p2[n].center);
    }

    EXPECT_EQ(grid->counts(), before);
}

TEST(GridQueryTest, CapZeroOrNothingQualifying) {
    GridQuery query(make_ramp_grid());
    EXPECT_TRUE(query.thresholded_points(0.0, 0).empty());
    EXPECT_TRUE(query.thresholded_points(1000.0, 10).empty());
}

TEST(GridQueryTest, PointCentersUseOrigin) {
    GridSpec spec = GridSpec::from_bounds(BBox(Vec3d(10, 20, 30), Vec3d(14, 22, 32)), 2.0);
    std::vector<uint32_t> counts(spec.cell_count(), 0);
    counts[spec.linear_index(1, 0, 0)] = 9;
    GridQuery query(std::make_shared<const VoxelGrid>(spec, std::move(counts)));

    auto pts = query.thresholded_points(0.0, 10);
    ASSERT_EQ(pts.size(), 1u);
    EXPECT_DOUBLE_EQ(pts[0].center.x, 13.0);
    EXPECT_DOUBLE_EQ(pts[0].center.y, 21.0);
    EXPECT_DOUBLE_EQ(pts[0].center.z, 31.0);
    EXPECT_EQ(pts[0].value, 9u);
}

TEST(GridQueryTest, CategoryLayerReturnsRanks) {
    std::vector<Point> pts = {
        {0.5, 0.5, 0.5, Category::Building},
        {1.5, 0.5, 0.5, Category::Terrain},
    };
    auto grid = voxelize(pts, 1.0, BBox(Vec3d(0, 0, 0), Vec3d(3, 1, 1))).grid;
    GridQuery query(grid);

    Plane s = query.slice(Axis::Z, 0, GridLayer::Category);
    EXPECT_EQ(s.at(0, 0), category_rank(Category::Building));
    EXPECT_EQ(s.at(1, 0), category_rank(Category::Terrain));
    EXPECT_EQ(s.at(2, 0), 0u);

    auto range = query.value_range(GridLayer::Category);
    EXPECT_EQ(range.first, 0u);
    EXPECT_EQ(range.second, 6u);

    EXPECT_EQ(query.count_above(0.0, GridLayer::Category), 2u);
}

TEST(GridQueryTest, CategoryLayerRequiresCategories) {
    GridQuery query(make_ramp_grid());
    EXPECT_THROW(query.slice(Axis::X, 0, GridLayer::Category), InvalidInputError);
    EXPECT_THROW(query.max_intensity_projection(Axis::X, GridLayer::Category), InvalidInputError);
    EXPECT_THROW(query.thresholded_points(0.0, 10, GridLayer::Category), InvalidInputError);
}

TEST(GridQueryTest, ValueRange) {
    GridQuery query(make_ramp_grid());
    auto range = query.value_range();
    EXPECT_EQ(range.first, 1u);
    EXPECT_EQ(range.second, 24u);
}

TEST(GridQueryTest, ParseAxisAndLayer) {
    EXPECT_EQ(parse_axis("x"), Axis::X);
    EXPECT_EQ(parse_axis("Z"), Axis::Z);
    EXPECT_THROW(parse_axis("w"), InvalidInputError);

    EXPECT_EQ(parse_layer("counts"), GridLayer::Counts);
    EXPECT_EQ(parse_layer("Category"), GridLayer::Category);
    EXPECT_THROW(parse_layer("rgb"), InvalidInputError);
}
