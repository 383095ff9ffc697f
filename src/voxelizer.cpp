#include "voxelizer.hpp"
#include "bounds_resolver.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <omp.h>

namespace voxgrid {

Voxelizer::Voxelizer(const GridSpec& spec)
    : spec_(spec)
{
    BoundsResolver::validate_voxel_size(spec_.voxel_size);
    if (spec_.cell_count() == 0) {
        throw InvalidInputError("Grid dims must be positive on every axis");
    }
}

int64_t Voxelizer::compute_cell_index(const Vec3d& pos) const {
    int64_t cell[3];
    for (int a = 0; a < 3; ++a) {
        double rel = (pos[a] - spec_.origin[a]) / spec_.voxel_size;
        if (!std::isfinite(rel)) {
            return kOutOfBounds;
        }
        double raw = std::floor(rel);
        const double dim = static_cast<double>(spec_.dims[a]);

        // Clamp by at most one cell; the upper face belongs to the last cell
        if (raw < -1.0 || raw > dim) {
            return kOutOfBounds;
        }
        int64_t c = static_cast<int64_t>(raw);
        cell[a] = std::max<int64_t>(0, std::min<int64_t>(c, static_cast<int64_t>(spec_.dims[a]) - 1));
    }
    return static_cast<int64_t>(spec_.linear_index(static_cast<size_t>(cell[0]),
                                                   static_cast<size_t>(cell[1]),
                                                   static_cast<size_t>(cell[2])));
}

std::optional<Category> Voxelizer::resolve_category(const CategoryTally& tally) {
    std::optional<Category> best;
    uint32_t best_count = 0;
    for (Category c : kCategoriesByPriority) {
        uint32_t n = tally[static_cast<size_t>(c)];
        if (n > best_count) {
            best = c;
            best_count = n;
        }
    }
    return best;
}

VoxelizeResult Voxelizer::run(const std::vector<Point>& points,
                              const VoxelizeOptions& options) const {
    const size_t n = points.size();
    const size_t block = std::max<size_t>(1, options.block_size);

    std::vector<uint32_t> counts(spec_.cell_count(), 0);
    const bool has_categories = std::any_of(points.begin(), points.end(),
        [](const Point& p) { return p.category.has_value(); });
    std::unordered_map<size_t, CategoryTally> tallies;

    if (options.progress) {
        options.progress(0, "Voxelizing " + std::to_string(n) + " points (" +
                            std::to_string(omp_get_max_threads()) + " threads)");
    }

    std::vector<int64_t> cell_of;
    size_t out_of_bounds = 0;

    for (size_t begin = 0; begin < n; begin += block) {
        if (options.is_cancelled && options.is_cancelled()) {
            throw CancelledError("Voxelization superseded by a newer request");
        }

        const size_t end = std::min(n, begin + block);
        const auto block_count = static_cast<ptrdiff_t>(end - begin);
        cell_of.resize(end - begin);

        #pragma omp parallel for schedule(static)
        for (ptrdiff_t i = 0; i < block_count; ++i) {
            cell_of[static_cast<size_t>(i)] =
                compute_cell_index(points[begin + static_cast<size_t>(i)].pos);
        }

        // Sequential scatter-add, independent of thread partitioning
        for (size_t i = 0; i < end - begin; ++i) {
            int64_t cell = cell_of[i];
            if (cell == kOutOfBounds) {
                ++out_of_bounds;
                continue;
            }
            ++counts[static_cast<size_t>(cell)];

            const auto& category = points[begin + i].category;
            if (category) {
                ++tallies[static_cast<size_t>(cell)][static_cast<size_t>(*category)];
            }
        }

        if (options.progress) {
            int percent = static_cast<int>((end * 100) / n);
            options.progress(percent, "Voxelized " + std::to_string(end) + "/" + std::to_string(n));
        }
    }

    std::vector<uint8_t> categories;
    if (has_categories) {
        categories.assign(counts.size(), kEmptyCategory);
        for (const auto& [cell, tally] : tallies) {
            auto label = resolve_category(tally);
            if (label) {
                categories[cell] = static_cast<uint8_t>(*label);
            }
        }
    }

    VoxelizeResult result;
    result.grid = std::make_shared<const VoxelGrid>(spec_, std::move(counts), std::move(categories));
    result.out_of_bounds = out_of_bounds;
    result.total = n;
    return result;
}

VoxelizeResult voxelize(const std::vector<Point>& points, const GridSpec& spec,
                        const VoxelizeOptions& options) {
    return Voxelizer(spec).run(points, options);
}

VoxelizeResult voxelize(const std::vector<Point>& points, double voxel_size,
                        const std::optional<BBox>& bounds,
                        const VoxelizeOptions& options) {
    GridSpec spec = make_grid_spec(points, voxel_size, bounds);
    return Voxelizer(spec).run(points, options);
}

} // namespace voxgrid
