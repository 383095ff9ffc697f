#include "synthetic.hpp"
#include "errors.hpp"
#include <cmath>
#include <random>

namespace voxgrid {

std::vector<Point> generate_sphere_shell(size_t count, double radius,
                                         double inner_fraction, uint32_t seed) {
    if (!(radius > 0.0) || !std::isfinite(radius)) {
        throw InvalidInputError("Sphere radius must be positive");
    }
    if (!(inner_fraction >= 0.0 && inner_fraction <= 1.0)) {
        throw InvalidInputError("Inner fraction must be within [0, 1]");
    }

    constexpr double kTwoPi = 6.283185307179586;

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> phi_dist(0.0, kTwoPi);
    std::uniform_real_distribution<double> cos_dist(-1.0, 1.0);
    std::uniform_real_distribution<double> shell_dist(inner_fraction, 1.0);

    std::vector<Point> points;
    points.reserve(count);
    for (size_t n = 0; n < count; ++n) {
        const double phi = phi_dist(rng);
        const double cos_theta = cos_dist(rng);
        const double r = shell_dist(rng) * radius;
        const double sin_theta = std::sqrt(1.0 - cos_theta * cos_theta);
        points.emplace_back(r * sin_theta * std::cos(phi),
                            r * sin_theta * std::sin(phi),
                            r * cos_theta);
    }
    return points;
}

} // namespace voxgrid
