#ifndef VOXGRID_VOXGRID_APP_HPP
#define VOXGRID_VOXGRID_APP_HPP

#include "types.hpp"
#include "voxelizer.hpp"
#include "grid_query.hpp"
#include <memory>
#include <string>
#include <vector>

namespace voxgrid {

class VoxGridApp {
public:
    VoxGridApp(int argc, char** argv);
    VoxGridApp(const AppConfig& config);  // Constructor for GUI and tests
    void setProgressCallback(ProgressCallback cb);
    void setLogCallback(LogCallback cb);
    void run();

    const AppConfig& config() const { return config_; }
    const VoxelizeResult& result() const { return result_; }

private:
    void reportProgress(int percent, const std::string& msg);
    void log(const std::string& msg);
    void parseArgs();
    void loadPoints();
    void validateOutput();
    void voxelizeGrid();
    void writeSlice();
    void writeProjection();
    void writePreview();
    void writeMesh();
    void writeMeta();
    void printUsage();

    int argc_;
    char** argv_;
    ProgressCallback progress_cb_;
    LogCallback log_cb_;

    AppConfig config_;
    std::string source_name_;

    std::vector<Point> points_;
    bool has_categories_ = false;
    VoxelizeResult result_;
    std::unique_ptr<GridQuery> query_;

    size_t qualifying_cells_ = 0;
    size_t preview_points_ = 0;
};

} // namespace voxgrid

#endif // VOXGRID_VOXGRID_APP_HPP
