#include "grid_cache.hpp"
#include "errors.hpp"
#include <cmath>
#include <cstring>
#include <tuple>

namespace voxgrid {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ull;
constexpr uint64_t kFnvPrime = 1099511628211ull;

void fnv_bytes(uint64_t& h, const void* data, size_t size) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < size; ++i) {
        h ^= bytes[i];
        h *= kFnvPrime;
    }
}

void fnv_double(uint64_t& h, double v) {
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    fnv_bytes(h, &bits, sizeof(bits));
}

std::array<double, 6> corners(const BBox& b) {
    return {{b.min.x, b.min.y, b.min.z, b.max.x, b.max.y, b.max.z}};
}

} // namespace

GridCacheKey::GridCacheKey(uint64_t hash, double size, const std::optional<BBox>& b)
    : point_set_hash(hash), voxel_size(size), bounds(b)
{
    // NaN would break the map ordering
    if (!std::isfinite(voxel_size)) {
        throw InvalidInputError("Cache key voxel size must be finite");
    }
    if (bounds && (!bounds->min.is_finite() || !bounds->max.is_finite())) {
        throw InvalidInputError("Cache key bounds must be finite");
    }
}

bool operator<(const GridCacheKey& a, const GridCacheKey& b) {
    if (a.point_set_hash != b.point_set_hash) return a.point_set_hash < b.point_set_hash;
    if (a.voxel_size != b.voxel_size) return a.voxel_size < b.voxel_size;
    if (a.bounds.has_value() != b.bounds.has_value()) return !a.bounds.has_value();
    if (!a.bounds) return false;
    return corners(*a.bounds) < corners(*b.bounds);
}

uint64_t hash_points(const std::vector<Point>& points) {
    uint64_t h = kFnvOffset;
    const uint64_t n = points.size();
    fnv_bytes(h, &n, sizeof(n));
    for (const auto& p : points) {
        fnv_double(h, p.pos.x);
        fnv_double(h, p.pos.y);
        fnv_double(h, p.pos.z);
        const uint8_t cat = p.category ? static_cast<uint8_t>(*p.category) : kEmptyCategory;
        fnv_bytes(h, &cat, sizeof(cat));
        const uint8_t has_intensity = p.intensity ? 1 : 0;
        fnv_bytes(h, &has_intensity, sizeof(has_intensity));
        if (p.intensity) {
            fnv_double(h, *p.intensity);
        }
    }
    return h;
}

GridCache::GridCache(size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ == 0) {
        throw InvalidInputError("GridCache capacity must be at least 1");
    }
}

size_t GridCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::shared_ptr<const VoxelizeResult> GridCache::find(const GridCacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    order_.splice(order_.begin(), order_, it->second.second);
    return it->second.first;
}

void GridCache::insert(const GridCacheKey& key, std::shared_ptr<const VoxelizeResult> result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.first = std::move(result);
        order_.splice(order_.begin(), order_, it->second.second);
        return;
    }
    order_.push_front(key);
    entries_.emplace(key, Entry(std::move(result), order_.begin()));
    purge();
}

size_t GridCache::invalidate(uint64_t point_set_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.point_set_hash == point_set_hash) {
            order_.erase(it->second.second);
            it = entries_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

void GridCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    order_.clear();
}

void GridCache::purge() {
    while (entries_.size() > capacity_) {
        entries_.erase(order_.back());
        order_.pop_back();
    }
}

} // namespace voxgrid
