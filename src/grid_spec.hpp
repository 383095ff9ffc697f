#ifndef VOXGRID_GRID_SPEC_HPP
#define VOXGRID_GRID_SPEC_HPP

#include "types.hpp"
#include <array>
#include <optional>
#include <vector>

namespace voxgrid {

// Upper limit on dims[0] * dims[1] * dims[2]
constexpr size_t kMaxGridCells = size_t(1) << 29;

struct GridSpec {
    BBox bounds;
    Vec3d origin;                          // bounds.min
    double voxel_size = 1.0;
    std::array<size_t, 3> dims{{1, 1, 1}}; // nx, ny, nz

    // dims_i = max(1, ceil((max_i - min_i) / voxel_size))
    static GridSpec from_bounds(const BBox& bounds, double voxel_size);

    size_t cell_count() const { return dims[0] * dims[1] * dims[2]; }

    // Row-major, x slowest, z fastest
    size_t linear_index(size_t i, size_t j, size_t k) const {
        return (i * dims[1] + j) * dims[2] + k;
    }

    std::array<size_t, 3> cell_of(size_t linear) const {
        return {{linear / (dims[1] * dims[2]),
                 (linear / dims[2]) % dims[1],
                 linear % dims[2]}};
    }

    Vec3d cell_center(size_t i, size_t j, size_t k) const;
    Vec3d cell_min_corner(size_t i, size_t j, size_t k) const;
    Vec3d upper_corner() const;
};

// Resolve bounds for the point set (or the override) and derive the grid
GridSpec make_grid_spec(const std::vector<Point>& points, double voxel_size,
                        const std::optional<BBox>& bounds = std::nullopt);

} // namespace voxgrid

#endif // VOXGRID_GRID_SPEC_HPP
