#include "grid_writer.hpp"
#include <cstdio>
#include <fstream>
#include <iomanip>

namespace voxgrid {

namespace {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

} // namespace

bool GridWriter::write_meta(const std::string& path, const GridInfo& info) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    const GridSpec& spec = info.spec;
    const Vec3d upper = spec.upper_corner();

    file << std::setprecision(15);

    file << "{\n";
    file << "\t\"version\": \"" << info.version << "\",\n";
    file << "\t\"source\": \"" << json_escape(info.source) << "\",\n";
    file << "\t\"voxelSize\": " << spec.voxel_size << ",\n";
    file << "\t\"dims\": [" << spec.dims[0] << ", " << spec.dims[1] << ", " << spec.dims[2] << "],\n";
    file << "\t\"origin\": [" << spec.origin.x << ", " << spec.origin.y << ", " << spec.origin.z << "],\n";

    file << "\t\"boundingBox\": {\n";
    file << "\t\t\"min\": [" << spec.bounds.min.x << ", " << spec.bounds.min.y << ", " << spec.bounds.min.z << "],\n";
    file << "\t\t\"max\": [" << spec.bounds.max.x << ", " << spec.bounds.max.y << ", " << spec.bounds.max.z << "]\n";
    file << "\t},\n";
    file << "\t\"gridExtent\": [" << upper.x << ", " << upper.y << ", " << upper.z << "],\n";

    file << "\t\"totalPoints\": " << info.total_points << ",\n";
    file << "\t\"outOfBounds\": " << info.out_of_bounds << ",\n";
    file << "\t\"occupiedCells\": " << info.occupied_cells << ",\n";
    file << "\t\"maxCount\": " << info.max_count << ",\n";

    // Category histogram
    file << "\t\"categories\": ";
    if (info.has_categories) {
        file << "{\n";
        for (size_t c = 0; c < kCategoryCount; ++c) {
            file << "\t\t\"" << category_name(static_cast<Category>(c)) << "\": " << info.category_cells[c]
                 << (c + 1 < kCategoryCount ? ",\n" : "\n");
        }
        file << "\t},\n";
    } else {
        file << "null,\n";
    }

    file << "\t\"preview\": {\n";
    file << "\t\t\"layer\": \"" << info.layer << "\",\n";
    file << "\t\t\"threshold\": " << info.threshold << ",\n";
    file << "\t\t\"cap\": " << info.cap << ",\n";
    file << "\t\t\"qualifyingCells\": " << info.qualifying_cells << ",\n";
    file << "\t\t\"points\": " << info.preview_points << "\n";
    file << "\t}\n";
    file << "}\n";

    return static_cast<bool>(file);
}

bool GridWriter::write_plane_csv(const std::string& path, const Plane& plane) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    for (size_t r = 0; r < plane.rows; ++r) {
        for (size_t c = 0; c < plane.cols; ++c) {
            if (c > 0) file << ",";
            file << plane.at(r, c);
        }
        file << "\n";
    }

    return static_cast<bool>(file);
}

bool GridWriter::write_points_csv(const std::string& path,
                                  const std::vector<ThresholdedPoint>& points) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    file << std::setprecision(10);
    file << "x,y,z,i,j,k,value\n";
    for (const auto& p : points) {
        file << p.center.x << "," << p.center.y << "," << p.center.z << ","
             << p.index[0] << "," << p.index[1] << "," << p.index[2] << ","
             << p.value << "\n";
    }

    return static_cast<bool>(file);
}

} // namespace voxgrid
