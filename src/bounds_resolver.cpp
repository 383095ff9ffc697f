#include "bounds_resolver.hpp"
#include "errors.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace voxgrid {

void BoundsResolver::validate_voxel_size(double voxel_size) {
    if (!std::isfinite(voxel_size) || voxel_size <= 0.0) {
        throw InvalidInputError("Voxel size must be a positive finite number, got " +
                                std::to_string(voxel_size));
    }
}

BBox BoundsResolver::compute_extent(const std::vector<Point>& points) {
    BBox bbox;
    for (const auto& p : points) {
        if (p.pos.is_finite()) {
            bbox.expand(p.pos);
        }
    }
    return bbox;
}

BBox BoundsResolver::resolve(const std::vector<Point>& points, double voxel_size,
                             const std::optional<BBox>& override_bounds) {
    validate_voxel_size(voxel_size);

    BBox bounds;
    if (override_bounds) {
        bounds = *override_bounds;
        if (!bounds.min.is_finite() || !bounds.max.is_finite()) {
            throw InvalidInputError("Explicit bounds must be finite");
        }
        for (int a = 0; a < 3; ++a) {
            if (bounds.max[a] < bounds.min[a]) {
                throw InvalidInputError(std::string("Explicit bounds inverted on axis ") +
                                        axis_name(static_cast<Axis>(a)));
            }
        }
    } else {
        if (points.empty()) {
            throw InvalidInputError("empty point set");
        }
        bounds = compute_extent(points);
        if (!bounds.valid()) {
            throw InvalidInputError("Point set has no finite coordinates");
        }
    }

    expand_degenerate_axes(bounds, voxel_size);

    for (int a = 0; a < 3; ++a) {
        if (!(bounds.max[a] > bounds.min[a])) {
            throw InvalidInputError(std::string("Bounds are degenerate on axis ") +
                                    axis_name(static_cast<Axis>(a)));
        }
    }

    return bounds;
}

void BoundsResolver::expand_degenerate_axes(BBox& bounds, double voxel_size) {
    const double half = 0.5 * voxel_size;
    for (int a = 0; a < 3; ++a) {
        if (bounds.min[a] == bounds.max[a]) {
            const double center = bounds.min[a];
            bounds.min[a] = center - half;
            bounds.max[a] = center + half;
            // Half a voxel below the coordinate's ulp: take the neighbouring doubles
            if (!(bounds.max[a] > bounds.min[a])) {
                bounds.min[a] = std::nextafter(center, -std::numeric_limits<double>::infinity());
                bounds.max[a] = std::nextafter(center, std::numeric_limits<double>::infinity());
            }
        }
    }
}

} // namespace voxgrid
