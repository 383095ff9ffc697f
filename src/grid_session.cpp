#include "grid_session.hpp"

namespace voxgrid {

uint64_t GridSession::begin_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++generation_;
}

CancelCheck GridSession::cancel_check(uint64_t generation) const {
    return [this, generation]() { return !is_current(generation); };
}

bool GridSession::publish(VoxelizeResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (result.generation != generation_.load()) {
        return false;
    }
    current_ = std::make_shared<const VoxelizeResult>(std::move(result));
    return true;
}

std::shared_ptr<const VoxelizeResult> GridSession::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void GridSession::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.reset();
}

} // namespace voxgrid
