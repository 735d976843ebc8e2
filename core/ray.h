/**
 * @file ray.h
 * @brief Ray structure and operations for path tracing
 */

#ifndef RAY_H
#define RAY_H

#include "vec3.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Ray with origin, direction and a shutter time
 *
 * The direction is not required to be unit length. The time is carried
 * unchanged through every bounce so motion blur samples stay coherent.
 */
typedef struct ray {
    point3 origin;
    vec3 direction;
    double time;
} ray;

/**
 * @brief Create a new ray at time zero
 * @param origin Ray origin point
 * @param direction Ray direction vector
 * @return New ray
 */
ray ray_create(point3 origin, vec3 direction);

/**
 * @brief Create a new ray at a given shutter time
 * @param origin Ray origin point
 * @param direction Ray direction vector
 * @param time Shutter time of the sample
 * @return New ray
 */
ray ray_create_timed(point3 origin, vec3 direction, double time);

/**
 * @brief Get point along ray at parameter t
 * @param r The ray
 * @param t Parameter value (distance along ray)
 * @return Point at r.origin + t * r.direction
 */
point3 ray_at(ray r, double t);

#ifdef __cplusplus
}
#endif

#endif /* RAY_H */
