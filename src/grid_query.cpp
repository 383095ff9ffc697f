#include "grid_query.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace voxgrid {

namespace {

std::array<size_t, 3> strides_of(const std::array<size_t, 3>& dims) {
    return {{dims[1] * dims[2], dims[2], 1}};
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

uint32_t Plane::max_value() const {
    if (values.empty()) return 0;
    return *std::max_element(values.begin(), values.end());
}

GridQuery::GridQuery(std::shared_ptr<const VoxelGrid> grid)
    : grid_(std::move(grid))
{
    if (!grid_) {
        throw InvalidInputError("GridQuery requires a grid");
    }
}

Plane GridQuery::make_plane(Axis axis) const {
    const auto& dims = grid_->dims();
    Plane plane;
    switch (axis) {
        case Axis::X: plane.row_axis = Axis::Y; plane.col_axis = Axis::Z; break;
        case Axis::Y: plane.row_axis = Axis::X; plane.col_axis = Axis::Z; break;
        case Axis::Z: plane.row_axis = Axis::X; plane.col_axis = Axis::Y; break;
    }
    plane.rows = dims[axis_index(plane.row_axis)];
    plane.cols = dims[axis_index(plane.col_axis)];
    plane.values.assign(plane.rows * plane.cols, 0);
    return plane;
}

Plane GridQuery::slice(Axis axis, size_t index, GridLayer layer) const {
    grid_->require_layer(layer);

    const auto& dims = grid_->dims();
    const size_t depth = dims[axis_index(axis)];
    if (index >= depth) {
        throw OutOfRangeError(std::string("Slice index ") + std::to_string(index) +
                              " out of range for axis " + axis_name(axis) +
                              " [0, " + std::to_string(depth - 1) + "]");
    }

    Plane plane = make_plane(axis);
    const auto strides = strides_of(dims);
    const size_t row_stride = strides[axis_index(plane.row_axis)];
    const size_t col_stride = strides[axis_index(plane.col_axis)];
    const size_t base = index * strides[axis_index(axis)];

    for (size_t r = 0; r < plane.rows; ++r) {
        for (size_t c = 0; c < plane.cols; ++c) {
            plane.values[r * plane.cols + c] = grid_->value(layer, base + r * row_stride + c * col_stride);
        }
    }
    return plane;
}

Plane GridQuery::max_intensity_projection(Axis axis, GridLayer layer) const {
    grid_->require_layer(layer);

    const auto& dims = grid_->dims();
    Plane plane = make_plane(axis);
    const auto strides = strides_of(dims);
    const size_t row_stride = strides[axis_index(plane.row_axis)];
    const size_t col_stride = strides[axis_index(plane.col_axis)];
    const size_t depth_stride = strides[axis_index(axis)];
    const size_t depth = dims[axis_index(axis)];
    const auto rows = static_cast<ptrdiff_t>(plane.rows);

    // Each output pixel is owned by one iteration
    #pragma omp parallel for schedule(static)
    for (ptrdiff_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < plane.cols; ++c) {
            const size_t base = static_cast<size_t>(r) * row_stride + c * col_stride;
            uint32_t best = 0;
            for (size_t t = 0; t < depth; ++t) {
                best = std::max(best, grid_->value(layer, base + t * depth_stride));
            }
            plane.values[static_cast<size_t>(r) * plane.cols + c] = best;
        }
    }
    return plane;
}

size_t GridQuery::count_above(double threshold, GridLayer layer) const {
    grid_->require_layer(layer);

    size_t n = 0;
    for (size_t i = 0; i < grid_->size(); ++i) {
        if (static_cast<double>(grid_->value(layer, i)) > threshold) {
            ++n;
        }
    }
    return n;
}

std::vector<ThresholdedPoint> GridQuery::thresholded_points(double threshold, size_t cap,
                                                            GridLayer layer) const {
    const size_t qualifying = count_above(threshold, layer);

    std::vector<ThresholdedPoint> out;
    if (cap == 0 || qualifying == 0) {
        return out;
    }

    const size_t take = std::min(cap, qualifying);
    out.reserve(take);

    const GridSpec& spec = grid_->spec();
    size_t ordinal = 0;
    size_t next = 0;  // m-th selected ordinal is floor(m * n / take)

    for (size_t i = 0; i < grid_->size() && out.size() < take; ++i) {
        const uint32_t value = grid_->value(layer, i);
        if (!(static_cast<double>(value) > threshold)) {
            continue;
        }
        if (ordinal == next) {
            const auto idx = spec.cell_of(i);
            out.push_back(ThresholdedPoint{spec.cell_center(idx[0], idx[1], idx[2]), idx, value});
            const size_t m = out.size();
            next = static_cast<size_t>((static_cast<unsigned long long>(m) * qualifying) / take);
        }
        ++ordinal;
    }
    return out;
}

std::pair<uint32_t, uint32_t> GridQuery::value_range(GridLayer layer) const {
    grid_->require_layer(layer);

    uint32_t lo = std::numeric_limits<uint32_t>::max();
    uint32_t hi = 0;
    for (size_t i = 0; i < grid_->size(); ++i) {
        const uint32_t v = grid_->value(layer, i);
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }
    return {lo, hi};
}

Axis parse_axis(const std::string& name) {
    const std::string n = lower(name);
    if (n == "x") return Axis::X;
    if (n == "y") return Axis::Y;
    if (n == "z") return Axis::Z;
    throw InvalidInputError("Axis must be one of X, Y, Z, got '" + name + "'");
}

GridLayer parse_layer(const std::string& name) {
    const std::string n = lower(name);
    if (n == "counts" || n == "count") return GridLayer::Counts;
    if (n == "category" || n == "categories") return GridLayer::Category;
    throw InvalidInputError("Layer must be 'counts' or 'category', got '" + name + "'");
}

} // namespace voxgrid
