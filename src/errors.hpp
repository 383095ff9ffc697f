#ifndef VOXGRID_ERRORS_HPP
#define VOXGRID_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace voxgrid {

// Bad request: empty point set, invalid bounds, non-positive voxel size, ...
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Slice index outside [0, dims_axis - 1]
class OutOfRangeError : public std::out_of_range {
public:
    explicit OutOfRangeError(const std::string& msg) : std::out_of_range(msg) {}
};

// A voxelization was superseded by a newer request
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace voxgrid

#endif // VOXGRID_ERRORS_HPP
