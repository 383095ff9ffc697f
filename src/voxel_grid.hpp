#ifndef VOXGRID_VOXEL_GRID_HPP
#define VOXGRID_VOXEL_GRID_HPP

#include "types.hpp"
#include "grid_spec.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace voxgrid {

// Dense count grid plus optional category layer. Immutable once built.
class VoxelGrid {
public:
    VoxelGrid(const GridSpec& spec,
              std::vector<uint32_t> counts,
              std::vector<uint8_t> categories = {});

    const GridSpec& spec() const { return spec_; }
    const std::array<size_t, 3>& dims() const { return spec_.dims; }
    size_t size() const { return counts_.size(); }
    bool has_categories() const { return !categories_.empty(); }

    const std::vector<uint32_t>& counts() const { return counts_; }
    const std::vector<uint8_t>& categories() const { return categories_; }

    uint32_t count(size_t i, size_t j, size_t k) const {
        return counts_[spec_.linear_index(i, j, k)];
    }

    // Empty when the grid has no category layer or no categorized point hit the cell
    std::optional<Category> category(size_t i, size_t j, size_t k) const;

    // Cell scalar for the layer: count, or category rank (0 = empty).
    // Callers check the layer once with require_layer().
    uint32_t value(GridLayer layer, size_t linear) const {
        if (layer == GridLayer::Counts) {
            return counts_[linear];
        }
        uint8_t code = categories_[linear];
        return code == kEmptyCategory ? 0u : category_rank(static_cast<Category>(code));
    }

    // Throws InvalidInputError when the category layer is requested but absent
    void require_layer(GridLayer layer) const;

    uint64_t total_count() const;
    size_t occupied_cells() const;
    uint32_t max_count() const;

    // Cells labelled with each category, indexed by category id
    std::array<uint64_t, kCategoryCount> category_histogram() const;

private:
    GridSpec spec_;
    std::vector<uint32_t> counts_;
    std::vector<uint8_t> categories_;
};

} // namespace voxgrid

#endif // VOXGRID_VOXEL_GRID_HPP
