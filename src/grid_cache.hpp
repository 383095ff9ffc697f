#ifndef VOXGRID_GRID_CACHE_HPP
#define VOXGRID_GRID_CACHE_HPP

#include "types.hpp"
#include "voxelizer.hpp"
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace voxgrid {

struct GridCacheKey {
    uint64_t point_set_hash = 0;
    double voxel_size = 0.0;
    std::optional<BBox> bounds;

    GridCacheKey() = default;
    // Throws InvalidInputError on a non-finite voxel size or bounds corner
    GridCacheKey(uint64_t hash, double size, const std::optional<BBox>& b = std::nullopt);
};

bool operator<(const GridCacheKey& a, const GridCacheKey& b);

// FNV-1a over coordinates, categories and intensities
uint64_t hash_points(const std::vector<Point>& points);

// Least-recently-used cache of finished grids. Entries are immutable, so a
// single mutex around the index is all the synchronization needed.
class GridCache {
public:
    explicit GridCache(size_t capacity = 8);

    size_t capacity() const { return capacity_; }
    size_t size() const;

    // Returns nullptr on miss; a hit becomes the most recently used entry
    std::shared_ptr<const VoxelizeResult> find(const GridCacheKey& key);

    void insert(const GridCacheKey& key, std::shared_ptr<const VoxelizeResult> result);

    // Drops every entry built from the given point set; returns how many
    size_t invalidate(uint64_t point_set_hash);

    void clear();

private:
    using Order = std::list<GridCacheKey>;
    using Entry = std::pair<std::shared_ptr<const VoxelizeResult>, Order::iterator>;
    using Map = std::map<GridCacheKey, Entry>;

    void purge();

    const size_t capacity_;

    mutable std::mutex mutex_;
    Map entries_;
    Order order_;  // front = most recently used
};

} // namespace voxgrid

#endif // VOXGRID_GRID_CACHE_HPP
