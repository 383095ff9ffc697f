#ifndef VOXGRID_VOXELIZER_HPP
#define VOXGRID_VOXELIZER_HPP

#include "types.hpp"
#include "grid_spec.hpp"
#include "voxel_grid.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace voxgrid {

struct VoxelizeOptions {
    ProgressCallback progress;
    CancelCheck is_cancelled;
    size_t block_size = size_t(1) << 16;  // points between cancel checks
};

struct VoxelizeResult {
    std::shared_ptr<const VoxelGrid> grid;
    size_t out_of_bounds = 0;  // dropped: far outside bounds or non-finite
    size_t total = 0;          // points processed
    uint64_t generation = 0;   // set by GridSession::begin_request callers

    double out_of_bounds_fraction() const {
        return total > 0 ? static_cast<double>(out_of_bounds) / static_cast<double>(total) : 0.0;
    }
};

using CategoryTally = std::array<uint32_t, kCategoryCount>;

class Voxelizer {
public:
    static constexpr int64_t kOutOfBounds = -1;

    explicit Voxelizer(const GridSpec& spec);

    const GridSpec& spec() const { return spec_; }

    // Linear cell index (thread-safe, no mutation), or kOutOfBounds
    int64_t compute_cell_index(const Vec3d& pos) const;

    // Throws CancelledError when options.is_cancelled fires between blocks
    VoxelizeResult run(const std::vector<Point>& points,
                       const VoxelizeOptions& options = VoxelizeOptions()) const;

    // Highest tally wins, ties go to the higher-priority category
    static std::optional<Category> resolve_category(const CategoryTally& tally);

private:
    GridSpec spec_;
};

VoxelizeResult voxelize(const std::vector<Point>& points, const GridSpec& spec,
                        const VoxelizeOptions& options = VoxelizeOptions());

// Validates voxel size and bounds before any aggregation work
VoxelizeResult voxelize(const std::vector<Point>& points, double voxel_size,
                        const std::optional<BBox>& bounds = std::nullopt,
                        const VoxelizeOptions& options = VoxelizeOptions());

} // namespace voxgrid

#endif // VOXGRID_VOXELIZER_HPP
