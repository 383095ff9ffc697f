#include "voxelizeworker.hpp"
#include "errors.hpp"
#include "point_reader.hpp"
#include "synthetic.hpp"

VoxelizeWorker::VoxelizeWorker(const VoxelizeRequest& request, uint64_t generation,
                               voxgrid::GridSession& session, voxgrid::GridCache& cache,
                               QObject* parent)
    : QThread(parent), request_(request), generation_(generation),
      session_(session), cache_(cache) {}

void VoxelizeWorker::run() {
    try {
        std::vector<voxgrid::Point> points;
        if (request_.input_path.empty()) {
            emit logMessage("Generating synthetic sphere shell");
            points = voxgrid::generate_sphere_shell();
        } else {
            emit logMessage("Reading " + QString::fromStdString(request_.input_path));
            auto loaded = voxgrid::PointReader::read(request_.input_path, request_.has_header);
            if (!loaded.has_value()) {
                emit voxelized(false, QString::fromStdString(loaded.error()));
                return;
            }
            if (loaded->skipped_rows > 0) {
                emit logMessage(QString("Warning: Skipped %1 malformed rows").arg(loaded->skipped_rows));
            }
            points = std::move((*loaded).points);
        }
        emit logMessage(QString("%1 points").arg(points.size()));

        voxgrid::GridCacheKey key(voxgrid::hash_points(points), request_.voxel_size, request_.bounds);
        if (auto cached = cache_.find(key)) {
            emit logMessage("Using cached grid");
            result_ = *cached;
        } else {
            voxgrid::VoxelizeOptions options;
            options.is_cancelled = session_.cancel_check(generation_);
            options.progress = [this](int percent, const std::string& msg) {
                emit progressChanged(percent);
                Q_UNUSED(msg);
            };

            result_ = voxgrid::voxelize(points, request_.voxel_size, request_.bounds, options);
            cache_.insert(key, std::make_shared<const voxgrid::VoxelizeResult>(result_));
        }
        result_.generation = generation_;

        emit voxelized(true, QString());
    } catch (const voxgrid::CancelledError&) {
        cancelled_ = true;
        emit voxelized(false, QString());
    } catch (const std::exception& e) {
        emit voxelized(false, QString::fromStdString(e.what()));
    }
}
