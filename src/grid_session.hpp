#ifndef VOXGRID_GRID_SESSION_HPP
#define VOXGRID_GRID_SESSION_HPP

#include "types.hpp"
#include "voxelizer.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace voxgrid {

// Tracks which voxelization request is current. A result is only installed if
// no newer request has started since it was issued; stale results are dropped.
class GridSession {
public:
    GridSession() = default;
    GridSession(const GridSession&) = delete;
    GridSession& operator=(const GridSession&) = delete;

    // Starts a new request and supersedes all in-flight ones
    uint64_t begin_request();

    uint64_t generation() const { return generation_.load(); }
    bool is_current(uint64_t generation) const { return generation == generation_.load(); }

    // Cancel check for Voxelizer; fires once the generation is superseded.
    // The session must outlive the returned callable.
    CancelCheck cancel_check(uint64_t generation) const;

    // Installs result if result.generation is still current
    bool publish(VoxelizeResult result);

    std::shared_ptr<const VoxelizeResult> current() const;

    void clear();

private:
    std::atomic<uint64_t> generation_{0};
    mutable std::mutex mutex_;
    std::shared_ptr<const VoxelizeResult> current_;
};

} // namespace voxgrid

#endif // VOXGRID_GRID_SESSION_HPP
