#ifndef VOXGRID_SYNTHETIC_HPP
#define VOXGRID_SYNTHETIC_HPP

#include "types.hpp"
#include <cstdint>
#include <vector>

namespace voxgrid {

// Uniform directions, radius drawn from [inner_fraction * radius, radius].
// Deterministic for a given seed.
std::vector<Point> generate_sphere_shell(size_t count = 100000,
                                         double radius = 50.0,
                                         double inner_fraction = 0.9,
                                         uint32_t seed = 42);

} // namespace voxgrid

#endif // VOXGRID_SYNTHETIC_HPP
