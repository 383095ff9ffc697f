#include "point_reader.hpp"
#include <miniply/miniply.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>

namespace fs = std::filesystem;

namespace voxgrid {

namespace {

constexpr size_t kNoColumn = static_cast<size_t>(-1);

struct ColumnMap {
    size_t x = 0;
    size_t y = 1;
    size_t z = 2;
    size_t category = 3;
    size_t intensity = 4;
};

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_fields(std::string line) {
    std::replace(line.begin(), line.end(), '\t', ',');
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtod(s.c_str(), &end);
    return errno != ERANGE && end == s.c_str() + s.size();
}

size_t find_column(const std::vector<std::string>& header,
                   std::initializer_list<const char*> names) {
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string h = lower(header[i]);
        for (const char* name : names) {
            if (h == name) return i;
        }
    }
    return kNoColumn;
}

ColumnMap map_header(const std::vector<std::string>& header) {
    ColumnMap cols;
    size_t x = find_column(header, {"x"});
    size_t y = find_column(header, {"y"});
    size_t z = find_column(header, {"z"});
    if (x == kNoColumn || y == kNoColumn || z == kNoColumn) {
        // Unnamed header: keep positional layout
        return cols;
    }
    cols.x = x;
    cols.y = y;
    cols.z = z;
    cols.category = find_column(header, {"category", "class", "classification", "label"});
    cols.intensity = find_column(header, {"intensity"});
    return cols;
}

} // namespace

Category PointReader::category_from_id(long long id) {
    if (id < 0 || id >= static_cast<long long>(kCategoryCount)) {
        return Category::Unknown;
    }
    return static_cast<Category>(id);
}

std::optional<Category> PointReader::parse_category(const std::string& label) {
    const std::string l = lower(trim(label));
    if (l.empty()) {
        return std::nullopt;
    }

    double id = 0.0;
    if (parse_double(l, id)) {
        if (!std::isfinite(id) || id < 0.0 ||
            id >= static_cast<double>(kCategoryCount) || id != std::floor(id)) {
            return Category::Unknown;
        }
        return category_from_id(static_cast<long long>(id));
    }

    if (l == "building" || l == "buildings" || l == "structure" || l == "structures") return Category::Building;
    if (l == "road" || l == "roads") return Category::Road;
    if (l == "vegetation" || l == "tree" || l == "trees") return Category::Vegetation;
    if (l == "terrain" || l == "ground") return Category::Terrain;
    if (l == "water") return Category::Water;
    return Category::Unknown;
}

PointsResult PointReader::read(const std::string& path, bool has_header) {
    const std::string ext = lower(fs::path(path).extension().string());
    if (ext == ".csv" || ext == ".txt") {
        return read_csv(path, has_header);
    }
    if (ext == ".ply") {
        return read_ply(path);
    }
    return ReadError{"Unsupported point file type '" + ext + "'. Use .csv or .ply"};
}

PointsResult PointReader::read_csv(const std::string& path, bool has_header) {
    std::ifstream file(path);
    if (!file) {
        return ReadError{"Failed to open CSV file: " + path};
    }

    PointSet set;
    ColumnMap cols;
    bool header_pending = has_header;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty()) continue;

        std::vector<std::string> fields = split_fields(line);
        if (header_pending) {
            header_pending = false;
            cols = map_header(fields);
            continue;
        }

        const size_t needed = std::max({cols.x, cols.y, cols.z}) + 1;
        if (fields.size() < 3 || fields.size() < needed) {
            ++set.skipped_rows;
            continue;
        }

        Point p;
        if (!parse_double(fields[cols.x], p.pos.x) ||
            !parse_double(fields[cols.y], p.pos.y) ||
            !parse_double(fields[cols.z], p.pos.z)) {
            ++set.skipped_rows;
            continue;
        }

        if (cols.category != kNoColumn && cols.category < fields.size()) {
            p.category = parse_category(fields[cols.category]);
            set.has_categories = set.has_categories || p.category.has_value();
        }

        double intensity = 0.0;
        if (cols.intensity != kNoColumn && cols.intensity < fields.size() &&
            parse_double(fields[cols.intensity], intensity)) {
            p.intensity = intensity;
            set.has_intensity = true;
        }

        set.points.push_back(p);
    }

    if (set.points.empty()) {
        return ReadError{"CSV must have at least 1 data row with x,y,z"};
    }
    return set;
}

PointsResult PointReader::read_ply(const std::string& path) {
    miniply::PLYReader reader(path.c_str());
    if (!reader.valid()) {
        return ReadError{"Failed to open PLY file: " + path};
    }

    // Find vertex element
    while (reader.has_element() && !reader.element_is(miniply::kPLYVertexElement)) {
        reader.next_element();
    }

    if (!reader.has_element()) {
        return ReadError{"No vertex element found in: " + path};
    }

    const uint32_t num_verts = reader.num_rows();
    if (num_verts == 0) {
        return ReadError{"PLY file has no vertices: " + path};
    }

    uint32_t pos_idx[3];
    if (!reader.find_properties(pos_idx, 3, "x", "y", "z")) {
        return ReadError{"Missing position properties in: " + path};
    }

    uint32_t class_idx = miniply::kInvalidIndex;
    for (const char* name : {"class", "classification", "category", "label"}) {
        class_idx = reader.find_property(name);
        if (class_idx != miniply::kInvalidIndex) break;
    }
    uint32_t intensity_idx = reader.find_property("intensity");

    if (!reader.load_element()) {
        return ReadError{"Failed to load vertex data from: " + path};
    }

    std::vector<double> positions(static_cast<size_t>(num_verts) * 3);
    if (!reader.extract_properties(pos_idx, 3, miniply::PLYPropertyType::Double, positions.data())) {
        return ReadError{"Failed to extract positions from: " + path};
    }

    std::vector<int32_t> classes;
    if (class_idx != miniply::kInvalidIndex) {
        classes.resize(num_verts);
        if (!reader.extract_properties(&class_idx, 1, miniply::PLYPropertyType::Int, classes.data())) {
            return ReadError{"Failed to extract classes from: " + path};
        }
    }

    std::vector<double> intensities;
    if (intensity_idx != miniply::kInvalidIndex) {
        intensities.resize(num_verts);
        if (!reader.extract_properties(&intensity_idx, 1, miniply::PLYPropertyType::Double, intensities.data())) {
            return ReadError{"Failed to extract intensity from: " + path};
        }
    }

    PointSet set;
    set.has_categories = !classes.empty();
    set.has_intensity = !intensities.empty();
    set.points.resize(num_verts);
    for (uint32_t i = 0; i < num_verts; ++i) {
        Point& p = set.points[i];
        p.pos = Vec3d(positions[i * 3], positions[i * 3 + 1], positions[i * 3 + 2]);
        if (set.has_categories) {
            p.category = category_from_id(classes[i]);
        }
        if (set.has_intensity) {
            p.intensity = intensities[i];
        }
    }

    return set;
}

} // namespace voxgrid
