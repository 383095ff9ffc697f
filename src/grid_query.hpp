#ifndef VOXGRID_GRID_QUERY_HPP
#define VOXGRID_GRID_QUERY_HPP

#include "types.hpp"
#include "voxel_grid.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace voxgrid {

// 2D result of a slice or projection. The queried axis is removed and the
// remaining two keep ascending order: rows follow row_axis, cols follow col_axis.
//   X -> rows Y, cols Z
//   Y -> rows X, cols Z
//   Z -> rows X, cols Y
struct Plane {
    Axis row_axis = Axis::X;
    Axis col_axis = Axis::Y;
    size_t rows = 0;
    size_t cols = 0;
    std::vector<uint32_t> values;  // row-major

    uint32_t at(size_t r, size_t c) const { return values[r * cols + c]; }
    uint32_t max_value() const;
};

struct ThresholdedPoint {
    Vec3d center;                  // origin + (index + 0.5) * voxel_size
    std::array<size_t, 3> index;
    uint32_t value;
};

// Read-only queries over a finished grid. Safe to share across threads.
class GridQuery {
public:
    explicit GridQuery(std::shared_ptr<const VoxelGrid> grid);

    const VoxelGrid& grid() const { return *grid_; }
    const std::shared_ptr<const VoxelGrid>& shared_grid() const { return grid_; }

    // Throws OutOfRangeError if index is not in [0, dims_axis - 1]
    Plane slice(Axis axis, size_t index, GridLayer layer = GridLayer::Counts) const;

    // Maximum along axis for every position of the perpendicular plane
    Plane max_intensity_projection(Axis axis, GridLayer layer = GridLayer::Counts) const;

    // Centers of cells with value > threshold (strict), in ascending (x, y, z)
    // index order. More than cap qualifying cells are downsampled by taking
    // ordinals floor(m * n / cap), m = 0..cap-1.
    std::vector<ThresholdedPoint> thresholded_points(double threshold, size_t cap,
                                                     GridLayer layer = GridLayer::Counts) const;

    size_t count_above(double threshold, GridLayer layer = GridLayer::Counts) const;

    // (min, max) cell value on the layer
    std::pair<uint32_t, uint32_t> value_range(GridLayer layer = GridLayer::Counts) const;

private:
    Plane make_plane(Axis axis) const;

    std::shared_ptr<const VoxelGrid> grid_;
};

// "X" / "y" / ... ; throws InvalidInputError otherwise
Axis parse_axis(const std::string& name);

// "counts" or "category"; throws InvalidInputError otherwise
GridLayer parse_layer(const std::string& name);

} // namespace voxgrid

#endif // VOXGRID_GRID_QUERY_HPP
