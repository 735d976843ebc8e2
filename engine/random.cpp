/**
 * @file random.cpp
 * @brief Thread-local random number generation
 */

#include "random.hpp"

#include <cmath>
#include <random>

namespace pathtracer {

// Thread-local random number generator
thread_local std::mt19937 rng{std::random_device{}()};
thread_local std::uniform_real_distribution<double> dist(0.0, 1.0);

void seed_random(std::uint64_t seed) {
    std::seed_seq seq{
        static_cast<std::uint32_t>(seed & 0xffffffffu),
        static_cast<std::uint32_t>(seed >> 32)
    };
    rng.seed(seq);
    dist.reset();
}

std::uint64_t pixel_seed(std::uint64_t base, int x, int y) {
    // splitmix64 finalizer over the packed pixel index
    std::uint64_t z = base
        + 0x9e3779b97f4a7c15ull * (static_cast<std::uint64_t>(static_cast<std::uint32_t>(y)) << 32
                                   | static_cast<std::uint32_t>(x));
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
    return z ^ (z >> 31);
}

double random_double() {
    return dist(rng);
}

double random_double(double min, double max) {
    return min + (max - min) * random_double();
}

vec3 random_in_unit_sphere() {
    while (true) {
        vec3 p = {random_double(-1, 1), random_double(-1, 1), random_double(-1, 1)};
        if (vec3_length_squared(p) < 1.0)
            return p;
    }
}

vec3 random_unit_vector() {
    return vec3_normalize(random_in_unit_sphere());
}

vec3 random_in_unit_disk() {
    while (true) {
        vec3 p = {random_double(-1, 1), random_double(-1, 1), 0.0};
        if (vec3_length_squared(p) < 1.0)
            return p;
    }
}

vec3 random_cosine_direction() {
    double r1 = random_double();
    double r2 = random_double();
    double phi = 2.0 * PI * r1;
    double sqrt_r2 = std::sqrt(r2);

    double x = std::cos(phi) * sqrt_r2;
    double y = std::sin(phi) * sqrt_r2;
    double z = std::sqrt(1.0 - r2);
    return {x, y, z};
}

vec3 random_to_sphere(double radius, double distance_squared) {
    double r1 = random_double();
    double r2 = random_double();
    double cos_theta_max = std::sqrt(std::fmax(0.0, 1.0 - radius * radius / distance_squared));
    double z = 1.0 + r2 * (cos_theta_max - 1.0);

    double phi = 2.0 * PI * r1;
    double sin_theta = std::sqrt(std::fmax(0.0, 1.0 - z * z));
    return {std::cos(phi) * sin_theta, std::sin(phi) * sin_theta, z};
}

} // namespace pathtracer
