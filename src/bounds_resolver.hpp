#ifndef VOXGRID_BOUNDS_RESOLVER_HPP
#define VOXGRID_BOUNDS_RESOLVER_HPP

#include "types.hpp"
#include <optional>
#include <vector>

namespace voxgrid {

class BoundsResolver {
public:
    // Bounds enclosing every finite point, or the override when given.
    // Degenerate axes are widened to one voxel centered on the value.
    // Throws InvalidInputError for an empty set without override,
    // a set with no finite point, or an inverted/non-finite override.
    static BBox resolve(const std::vector<Point>& points, double voxel_size,
                        const std::optional<BBox>& override_bounds = std::nullopt);

    // Min/max over points with finite coordinates (invalid if none)
    static BBox compute_extent(const std::vector<Point>& points);

    // Throws InvalidInputError unless voxel_size is finite and > 0
    static void validate_voxel_size(double voxel_size);

private:
    static void expand_degenerate_axes(BBox& bounds, double voxel_size);
};

} // namespace voxgrid

#endif // VOXGRID_BOUNDS_RESOLVER_HPP
