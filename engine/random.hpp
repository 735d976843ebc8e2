/**
 * @file random.hpp
 * @brief Random number generation and direction sampling
 *
 * Every thread owns a private generator. The render driver reseeds it at
 * the start of each pixel, so a pixel's sample stream never depends on
 * which worker picked it up.
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include <cstdint>

namespace pathtracer {

constexpr double PI = 3.14159265358979323846;
constexpr double INV_PI = 0.31830988618379067;

/**
 * @brief Reseed the calling thread's generator
 */
void seed_random(std::uint64_t seed);

/**
 * @brief Derive an independent seed for one pixel from a base seed
 */
std::uint64_t pixel_seed(std::uint64_t base, int x, int y);

/**
 * @brief Uniform double in [0, 1)
 */
double random_double();

/**
 * @brief Uniform double in [min, max)
 */
double random_double(double min, double max);

// Rejection sample inside the unit ball
vec3 random_in_unit_sphere();

// Unit vector, uniform over the sphere
vec3 random_unit_vector();

// Rejection sample inside the unit disk (z = 0)
vec3 random_in_unit_disk();

/**
 * @brief Cosine-weighted direction in the local +Z hemisphere
 *
 * Maps two uniform variables to the disk and lifts them onto the
 * hemisphere. The density is cos(theta) / PI.
 */
vec3 random_cosine_direction();

/**
 * @brief Direction in the local +Z cone subtending a sphere
 * @param radius Sphere radius
 * @param distance_squared Squared distance from the origin to the center
 *
 * Uniform in solid angle over the cone of half-angle theta_max with
 * sin(theta_max) = radius / distance.
 */
vec3 random_to_sphere(double radius, double distance_squared);

} // namespace pathtracer
