#ifndef VOXGRID_POINT_READER_HPP
#define VOXGRID_POINT_READER_HPP

#include "types.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace voxgrid {

struct PointSet {
    std::vector<Point> points;
    size_t skipped_rows = 0;     // malformed CSV rows
    bool has_categories = false;
    bool has_intensity = false;
};

struct ReadError {
    std::string message;
};

class PointsResult {
public:
    PointsResult(PointSet set) : result_(std::move(set)) {}
    PointsResult(ReadError error) : result_(std::move(error)) {}

    bool has_value() const { return std::holds_alternative<PointSet>(result_); }
    const PointSet& operator*() const { return std::get<PointSet>(result_); }
    PointSet& operator*() { return std::get<PointSet>(result_); }
    const PointSet* operator->() const { return &std::get<PointSet>(result_); }
    std::string error() const { return std::get<ReadError>(result_).message; }

private:
    std::variant<PointSet, ReadError> result_;
};

class PointReader {
public:
    // Dispatch on extension: .csv/.txt -> CSV, .ply -> PLY
    static PointsResult read(const std::string& path, bool has_header = true);

    // Comma or tab separated. With a header, columns are found by name
    // (x, y, z, category|class|label, intensity); otherwise positional
    // x,y,z[,category[,intensity]]. Rows with < 3 fields or bad numbers are skipped.
    static PointsResult read_csv(const std::string& path, bool has_header = true);

    // Vertex x,y,z plus optional class|classification|category and intensity
    static PointsResult read_ply(const std::string& path);

    // Names (case-insensitive, plurals accepted) or ids 0-5.
    // Empty -> nullopt, anything unrecognized -> Unknown.
    static std::optional<Category> parse_category(const std::string& label);

    // Category id from a numeric PLY/CSV class value, Unknown if out of range
    static Category category_from_id(long long id);
};

} // namespace voxgrid

#endif // VOXGRID_POINT_READER_HPP
