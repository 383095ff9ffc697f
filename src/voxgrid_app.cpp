#include "voxgrid_app.hpp"
#include "point_reader.hpp"
#include "synthetic.hpp"
#include "grid_writer.hpp"
#include "face_mesh.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace voxgrid {

namespace {

double parse_number(const std::string& option, const char* text) {
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE) {
        throw std::runtime_error("Invalid value for " + option + ": " + text);
    }
    return value;
}

size_t parse_count(const std::string& option, const char* text) {
    double value = parse_number(option, text);
    // 2^64 is the first double past size_t
    if (!std::isfinite(value) || value < 0.0 || value >= 18446744073709551616.0 ||
        value != std::floor(value)) {
        throw std::runtime_error("Invalid value for " + option + ": " + text);
    }
    return static_cast<size_t>(value);
}

std::string format_vec(const Vec3d& v) {
    std::ostringstream ss;
    ss << "(" << v.x << ", " << v.y << ", " << v.z << ")";
    return ss.str();
}

} // namespace

VoxGridApp::VoxGridApp(int argc, char** argv)
    : argc_(argc), argv_(argv) {}

VoxGridApp::VoxGridApp(const AppConfig& config)
    : argc_(0), argv_(nullptr), config_(config) {}

void VoxGridApp::setProgressCallback(ProgressCallback cb) {
    progress_cb_ = std::move(cb);
}

void VoxGridApp::setLogCallback(LogCallback cb) {
    log_cb_ = std::move(cb);
}

void VoxGridApp::reportProgress(int percent, const std::string& msg) {
    if (progress_cb_) {
        progress_cb_(percent, msg);
    }
}

void VoxGridApp::log(const std::string& msg) {
    if (log_cb_) {
        log_cb_(msg);
    } else {
        std::cout << msg;
    }
}

void VoxGridApp::run() {
    reportProgress(0, "Starting voxelization...");

    parseArgs();
    validateOutput();

    reportProgress(2, "Loading points...");
    loadPoints();

    reportProgress(10, "Voxelizing...");
    voxelizeGrid();

    reportProgress(75, "Writing output files...");
    writeSlice();
    writeProjection();
    writePreview();
    writeMesh();
    writeMeta();

    reportProgress(100, "Done!");

    log("\nDone!\n");
    log("Output: " + config_.output_dir + "\n");
}

void VoxGridApp::printUsage() {
    const char* prog = argv_ ? argv_[0] : "voxgrid";
    std::cerr << "Usage: " << prog << " [-i <points.csv|points.ply>] -o <output_dir> [options]\n"
              << "\n"
              << "Without -i a synthetic sphere shell is voxelized.\n"
              << "\n"
              << "Options:\n"
              << "  --voxel-size S         Cubic voxel edge length (default: 2.0)\n"
              << "  --bounds a,b,c,d,e,f   Explicit xmin,ymin,zmin,xmax,ymax,zmax\n"
              << "  --threshold T          Preview threshold, value > T (default: 5)\n"
              << "  --cap N                Preview point cap (default: 30000)\n"
              << "  --axis X|Y|Z           Slice and projection axis (default: Z)\n"
              << "  --index N              Slice index (default: 0)\n"
              << "  --layer counts|category  Layer used by queries (default: counts)\n"
              << "  --no-header            CSV input has no header row\n"
              << "  --mesh                 Also write mesh.obj\n"
              << "  --warn-oob P           Warn above P percent out-of-bounds points (default: 5)\n";
}

void VoxGridApp::parseArgs() {
    for (int i = 1; i < argc_; ++i) {
        std::string arg = argv_[i];
        if (arg == "-i" && i + 1 < argc_) {
            config_.input_path = argv_[++i];
        } else if (arg == "-o" && i + 1 < argc_) {
            config_.output_dir = argv_[++i];
        } else if (arg == "--voxel-size" && i + 1 < argc_) {
            config_.voxel_size = parse_number(arg, argv_[++i]);
        } else if (arg == "--bounds" && i + 1 < argc_) {
            BBox b;
            char tail = '\0';
            if (sscanf(argv_[++i], "%lf,%lf,%lf,%lf,%lf,%lf%c",
                       &b.min.x, &b.min.y, &b.min.z, &b.max.x, &b.max.y, &b.max.z, &tail) != 6) {
                throw std::runtime_error("Invalid bounds format. Use xmin,ymin,zmin,xmax,ymax,zmax");
            }
            config_.bounds = b;
        } else if (arg == "--threshold" && i + 1 < argc_) {
            config_.threshold = parse_number(arg, argv_[++i]);
        } else if (arg == "--cap" && i + 1 < argc_) {
            config_.cap = parse_count(arg, argv_[++i]);
        } else if (arg == "--axis" && i + 1 < argc_) {
            config_.axis = parse_axis(argv_[++i]);
        } else if (arg == "--index" && i + 1 < argc_) {
            config_.slice_index = parse_count(arg, argv_[++i]);
        } else if (arg == "--layer" && i + 1 < argc_) {
            config_.layer = parse_layer(argv_[++i]);
        } else if (arg == "--no-header") {
            config_.has_header = false;
        } else if (arg == "--mesh") {
            config_.write_mesh = true;
        } else if (arg == "--warn-oob" && i + 1 < argc_) {
            config_.warn_oob_percent = parse_number(arg, argv_[++i]);
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            std::exit(EXIT_SUCCESS);
        } else {
            printUsage();
            throw std::runtime_error("Unknown or incomplete argument: " + arg);
        }
    }

    if (config_.output_dir.empty()) {
        if (argv_) printUsage();
        throw std::runtime_error("Missing required argument: -o");
    }

    if (!config_.input_path.empty() && !fs::exists(config_.input_path)) {
        throw std::runtime_error("Input file not found: " + config_.input_path);
    }
}

void VoxGridApp::validateOutput() {
    fs::create_directories(config_.output_dir);

    if (!fs::is_empty(config_.output_dir)) {
        log("Warning: Output directory is not empty: " + config_.output_dir + "\n");
    }

    log("Output: " + config_.output_dir + "\n");
    log("Voxel size: " + std::to_string(config_.voxel_size) + "\n");
}

void VoxGridApp::loadPoints() {
    if (config_.input_path.empty()) {
        source_name_ = "synthetic:sphere_shell";
        log("Input: synthetic sphere shell\n");
        points_ = generate_sphere_shell();
    } else {
        source_name_ = config_.input_path;
        log("Input: " + config_.input_path + "\n");

        auto loaded = PointReader::read(config_.input_path, config_.has_header);
        if (!loaded.has_value()) {
            throw std::runtime_error(loaded.error());
        }
        if (loaded->skipped_rows > 0) {
            log("Warning: Skipped " + std::to_string(loaded->skipped_rows) + " malformed rows\n");
        }
        points_ = std::move((*loaded).points);
    }

    has_categories_ = std::any_of(points_.begin(), points_.end(),
        [](const Point& p) { return p.category.has_value(); });

    log("  " + std::to_string(points_.size()) + " points" +
        (has_categories_ ? " (categorized)" : "") + "\n");
}

void VoxGridApp::voxelizeGrid() {
    log("\nVoxelizing...\n");

    VoxelizeOptions options;
    options.progress = [this](int percent, const std::string& msg) {
        reportProgress(10 + percent * 65 / 100, msg);
    };

    result_ = voxelize(points_, config_.voxel_size, config_.bounds, options);
    const VoxelGrid& grid = *result_.grid;
    const GridSpec& spec = grid.spec();

    log("Bounds: " + format_vec(spec.bounds.min) + " - " + format_vec(spec.bounds.max) + "\n");
    log("Dims: " + std::to_string(spec.dims[0]) + " x " + std::to_string(spec.dims[1]) +
        " x " + std::to_string(spec.dims[2]) + " (" + std::to_string(spec.cell_count()) + " cells)\n");
    log("Occupied cells: " + std::to_string(grid.occupied_cells()) +
        ", max count: " + std::to_string(grid.max_count()) + "\n");

    const double oob_percent = result_.out_of_bounds_fraction() * 100.0;
    if (result_.out_of_bounds > 0) {
        log("Out of bounds: " + std::to_string(result_.out_of_bounds) + " points\n");
    }
    if (oob_percent > config_.warn_oob_percent) {
        log("Warning: " + std::to_string(oob_percent) + "% of points fell outside the bounds\n");
    }

    grid.require_layer(config_.layer);
    query_ = std::make_unique<GridQuery>(result_.grid);
}

void VoxGridApp::writeSlice() {
    Plane plane = query_->slice(config_.axis, config_.slice_index, config_.layer);
    std::string name = std::string("slice_") + axis_name(config_.axis) + "_" +
                       std::to_string(config_.slice_index) + ".csv";
    std::string path = (fs::path(config_.output_dir) / name).string();

    log("Writing " + name + " (" + std::to_string(plane.rows) + " x " +
        std::to_string(plane.cols) + ")\n");
    if (!GridWriter::write_plane_csv(path, plane)) {
        throw std::runtime_error("Failed to write " + path);
    }
}

void VoxGridApp::writeProjection() {
    Plane plane = query_->max_intensity_projection(config_.axis, config_.layer);
    std::string name = std::string("mip_") + axis_name(config_.axis) + ".csv";
    std::string path = (fs::path(config_.output_dir) / name).string();

    log("Writing " + name + " (max " + std::to_string(plane.max_value()) + ")\n");
    if (!GridWriter::write_plane_csv(path, plane)) {
        throw std::runtime_error("Failed to write " + path);
    }
}

void VoxGridApp::writePreview() {
    qualifying_cells_ = query_->count_above(config_.threshold, config_.layer);
    auto points = query_->thresholded_points(config_.threshold, config_.cap, config_.layer);
    preview_points_ = points.size();

    std::string path = (fs::path(config_.output_dir) / "preview.csv").string();
    log("Writing preview.csv (" + std::to_string(preview_points_) + " of " +
        std::to_string(qualifying_cells_) + " cells above threshold)\n");
    if (qualifying_cells_ == 0) {
        log("Warning: No voxels above threshold\n");
    }
    if (!GridWriter::write_points_csv(path, points)) {
        throw std::runtime_error("Failed to write " + path);
    }
}

void VoxGridApp::writeMesh() {
    if (!config_.write_mesh) {
        return;
    }

    // On the category layer every labelled cell is part of the mesh
    const double threshold = config_.layer == GridLayer::Category ? 0.0 : config_.threshold;
    auto meshes = FaceMesher::extract(*result_.grid, config_.layer, threshold);

    size_t faces = 0;
    for (const auto& mesh : meshes) {
        faces += mesh.face_count();
    }

    std::string path = (fs::path(config_.output_dir) / "mesh.obj").string();
    log("Writing mesh.obj (" + std::to_string(faces) + " faces)\n");
    if (!FaceMesher::write_obj(path, meshes)) {
        throw std::runtime_error("Failed to write " + path);
    }
}

void VoxGridApp::writeMeta() {
    const VoxelGrid& grid = *result_.grid;

    GridInfo info;
    info.source = source_name_;
    info.spec = grid.spec();
    info.total_points = result_.total;
    info.out_of_bounds = result_.out_of_bounds;
    info.occupied_cells = grid.occupied_cells();
    info.max_count = grid.max_count();
    info.has_categories = grid.has_categories();
    if (info.has_categories) {
        info.category_cells = grid.category_histogram();
    }
    info.layer = config_.layer == GridLayer::Category ? "category" : "counts";
    info.threshold = config_.threshold;
    info.cap = config_.cap;
    info.qualifying_cells = qualifying_cells_;
    info.preview_points = preview_points_;

    std::string path = (fs::path(config_.output_dir) / "meta.json").string();
    log("Writing meta.json\n");
    if (!GridWriter::write_meta(path, info)) {
        throw std::runtime_error("Failed to write " + path);
    }
}

} // namespace voxgrid
