#ifndef VOXGRID_TYPES_HPP
#define VOXGRID_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <vector>
#include <array>
#include <string>
#include <limits>
#include <cmath>
#include <optional>
#include <functional>

namespace voxgrid {

struct Vec3d {
    double x, y, z;

    Vec3d() : x(0), y(0), z(0) {}
    Vec3d(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    double& operator[](int i) { return (&x)[i]; }
    double operator[](int i) const { return (&x)[i]; }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }
};

inline bool operator==(const Vec3d& a, const Vec3d& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const Vec3d& a, const Vec3d& b) {
    return !(a == b);
}

struct BBox {
    Vec3d min{std::numeric_limits<double>::max(),
              std::numeric_limits<double>::max(),
              std::numeric_limits<double>::max()};
    Vec3d max{std::numeric_limits<double>::lowest(),
              std::numeric_limits<double>::lowest(),
              std::numeric_limits<double>::lowest()};

    BBox() = default;
    BBox(const Vec3d& min_, const Vec3d& max_) : min(min_), max(max_) {}

    void expand(const Vec3d& p) {
        for (int i = 0; i < 3; ++i) {
            if (p[i] < min[i]) min[i] = p[i];
            if (p[i] > max[i]) max[i] = p[i];
        }
    }

    void expand(const BBox& other) {
        for (int i = 0; i < 3; ++i) {
            if (other.min[i] < min[i]) min[i] = other.min[i];
            if (other.max[i] > max[i]) max[i] = other.max[i];
        }
    }

    // True once at least one point has been added (min <= max on every axis)
    bool valid() const {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    bool contains(const Vec3d& p) const {
        for (int i = 0; i < 3; ++i) {
            if (p[i] < min[i] || p[i] > max[i]) return false;
        }
        return true;
    }
};

inline bool operator==(const BBox& a, const BBox& b) {
    return a.min == b.min && a.max == b.max;
}

enum class Axis : int { X = 0, Y = 1, Z = 2 };

inline int axis_index(Axis axis) {
    return static_cast<int>(axis);
}

inline const char* axis_name(Axis axis) {
    switch (axis) {
        case Axis::X: return "X";
        case Axis::Y: return "Y";
        case Axis::Z: return "Z";
    }
    return "?";
}

// Label ids are stable and match the exported category tables:
// 0=terrain, 1=building, 2=road, 3=vegetation, 4=water, 5=unknown
enum class Category : uint8_t {
    Terrain = 0,
    Building = 1,
    Road = 2,
    Vegetation = 3,
    Water = 4,
    Unknown = 5
};

constexpr size_t kCategoryCount = 6;

// Stored in the category layer for cells no categorized point landed in
constexpr uint8_t kEmptyCategory = 0xFF;

// Tie-break order, highest priority first
constexpr std::array<Category, kCategoryCount> kCategoriesByPriority = {
    Category::Building, Category::Road, Category::Vegetation,
    Category::Water, Category::Terrain, Category::Unknown
};

// Rank used for category-layer queries: Building=6 ... Unknown=1, empty cell=0
inline uint32_t category_rank(Category c) {
    switch (c) {
        case Category::Building:   return 6;
        case Category::Road:       return 5;
        case Category::Vegetation: return 4;
        case Category::Water:      return 3;
        case Category::Terrain:    return 2;
        case Category::Unknown:    return 1;
    }
    return 0;
}

inline std::optional<Category> category_from_rank(uint32_t rank) {
    if (rank == 0 || rank > kCategoryCount) {
        return std::nullopt;
    }
    return kCategoriesByPriority[kCategoryCount - rank];
}

inline const char* category_name(Category c) {
    switch (c) {
        case Category::Terrain:    return "terrain";
        case Category::Building:   return "building";
        case Category::Road:       return "road";
        case Category::Vegetation: return "vegetation";
        case Category::Water:      return "water";
        case Category::Unknown:    return "unknown";
    }
    return "unknown";
}

struct Point {
    Vec3d pos;
    std::optional<Category> category;
    std::optional<double> intensity;

    Point() = default;
    Point(double x, double y, double z) : pos(x, y, z) {}
    Point(double x, double y, double z, Category c) : pos(x, y, z), category(c) {}
};

// Which per-cell scalar a query reads
enum class GridLayer { Counts, Category };

struct AppConfig {
    std::string input_path;      // CSV or PLY; empty selects the synthetic sphere shell
    std::string output_dir;
    double voxel_size = 2.0;
    std::optional<BBox> bounds;
    double threshold = 5.0;      // strict: value > threshold
    size_t cap = 30000;
    Axis axis = Axis::Z;
    size_t slice_index = 0;
    GridLayer layer = GridLayer::Counts;
    bool has_header = true;
    bool write_mesh = false;
    double warn_oob_percent = 5.0;
};

// Progress callback for GUI integration
using ProgressCallback = std::function<void(int percent, const std::string& message)>;

// Log callback for redirecting console output (GUI integration)
using LogCallback = std::function<void(const std::string& message)>;

// Polled between work blocks; returning true abandons the operation
using CancelCheck = std::function<bool()>;

} // namespace voxgrid

#endif // VOXGRID_TYPES_HPP
