#ifndef VOXELIZEWORKER_HPP
#define VOXELIZEWORKER_HPP

#include <QThread>
#include <QString>
#include "types.hpp"
#include "voxelizer.hpp"
#include "grid_session.hpp"
#include "grid_cache.hpp"

struct VoxelizeRequest {
    std::string input_path;   // empty selects the synthetic sphere shell
    bool has_header = true;
    double voxel_size = 2.0;
    std::optional<voxgrid::BBox> bounds;
};

// Loads points and voxelizes them off the GUI thread. The result is handed
// back through GridSession, which drops it if a newer request has started.
class VoxelizeWorker : public QThread {
    Q_OBJECT
public:
    VoxelizeWorker(const VoxelizeRequest& request, uint64_t generation,
                   voxgrid::GridSession& session, voxgrid::GridCache& cache,
                   QObject* parent = nullptr);

    uint64_t generation() const { return generation_; }
    bool wasCancelled() const { return cancelled_; }
    const voxgrid::VoxelizeResult& result() const { return result_; }

signals:
    void progressChanged(int percent);
    void logMessage(const QString& message);
    void voxelized(bool success, const QString& error);

protected:
    void run() override;

private:
    VoxelizeRequest request_;
    uint64_t generation_;
    voxgrid::GridSession& session_;
    voxgrid::GridCache& cache_;

    voxgrid::VoxelizeResult result_;
    bool cancelled_ = false;
};

#endif
