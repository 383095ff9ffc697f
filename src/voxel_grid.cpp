#include "voxel_grid.hpp"
#include "errors.hpp"
#include <algorithm>
#include <numeric>
#include <string>

namespace voxgrid {

VoxelGrid::VoxelGrid(const GridSpec& spec,
                     std::vector<uint32_t> counts,
                     std::vector<uint8_t> categories)
    : spec_(spec)
    , counts_(std::move(counts))
    , categories_(std::move(categories))
{
    if (counts_.size() != spec_.cell_count()) {
        throw InvalidInputError("Count layer has " + std::to_string(counts_.size()) +
                                " cells, grid needs " + std::to_string(spec_.cell_count()));
    }
    if (!categories_.empty() && categories_.size() != counts_.size()) {
        throw InvalidInputError("Category layer size does not match the grid");
    }
}

std::optional<Category> VoxelGrid::category(size_t i, size_t j, size_t k) const {
    if (categories_.empty()) {
        return std::nullopt;
    }
    uint8_t code = categories_[spec_.linear_index(i, j, k)];
    if (code == kEmptyCategory) {
        return std::nullopt;
    }
    return static_cast<Category>(code);
}

void VoxelGrid::require_layer(GridLayer layer) const {
    if (layer == GridLayer::Category && categories_.empty()) {
        throw InvalidInputError("Grid has no category layer (input points carry no categories)");
    }
}

uint64_t VoxelGrid::total_count() const {
    return std::accumulate(counts_.begin(), counts_.end(), uint64_t(0));
}

size_t VoxelGrid::occupied_cells() const {
    return static_cast<size_t>(std::count_if(counts_.begin(), counts_.end(),
                                             [](uint32_t c) { return c > 0; }));
}

uint32_t VoxelGrid::max_count() const {
    if (counts_.empty()) return 0;
    return *std::max_element(counts_.begin(), counts_.end());
}

std::array<uint64_t, kCategoryCount> VoxelGrid::category_histogram() const {
    std::array<uint64_t, kCategoryCount> hist{};
    for (uint8_t code : categories_) {
        if (code != kEmptyCategory && code < kCategoryCount) {
            ++hist[code];
        }
    }
    return hist;
}

} // namespace voxgrid
