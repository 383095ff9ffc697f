#ifndef VOXGRID_GRID_WRITER_HPP
#define VOXGRID_GRID_WRITER_HPP

#include "types.hpp"
#include "grid_spec.hpp"
#include "grid_query.hpp"
#include <array>
#include <string>
#include <vector>

namespace voxgrid {

struct GridInfo {
    std::string version = "1.0";
    std::string source;              // input path or synthetic generator name
    GridSpec spec;

    size_t total_points = 0;
    size_t out_of_bounds = 0;
    size_t occupied_cells = 0;
    uint32_t max_count = 0;

    bool has_categories = false;
    std::array<uint64_t, kCategoryCount> category_cells{};

    std::string layer = "counts";
    double threshold = 0.0;
    size_t cap = 0;
    size_t qualifying_cells = 0;
    size_t preview_points = 0;
};

class GridWriter {
public:
    static bool write_meta(const std::string& path, const GridInfo& info);

    // One line per plane row (row_axis), comma-separated along col_axis
    static bool write_plane_csv(const std::string& path, const Plane& plane);

    // Header "x,y,z,i,j,k,value"
    static bool write_points_csv(const std::string& path,
                                 const std::vector<ThresholdedPoint>& points);
};

} // namespace voxgrid

#endif // VOXGRID_GRID_WRITER_HPP
