/**
 * @file camera.hpp
 * @brief Thin-lens camera with a shutter interval
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
}

#include "random.hpp"
#include <cmath>

namespace pathtracer {

/**
 * @brief Camera for generating rays
 */
struct Camera {
    point3 origin = {0.0, 0.0, 0.0};
    point3 lower_left_corner = {-1.0, -1.0, -1.0};
    vec3 horizontal = {2.0, 0.0, 0.0};
    vec3 vertical = {0.0, 2.0, 0.0};
    vec3 u = {1.0, 0.0, 0.0};
    vec3 v = {0.0, 1.0, 0.0};
    vec3 w = {0.0, 0.0, 1.0};
    double lens_radius = 0.0;
    double time0 = 0.0;
    double time1 = 0.0;

    Camera() = default;

    /**
     * @brief Create a camera with the given parameters
     * @param lookfrom Camera position
     * @param lookat Point to look at
     * @param vup View up vector
     * @param vfov Vertical field of view in degrees
     * @param aspect_ratio Width/height ratio
     * @param aperture Lens diameter (0 = pinhole)
     * @param focus_dist Distance to the plane in perfect focus
     * @param t0 Shutter open time
     * @param t1 Shutter close time
     */
    Camera(point3 lookfrom, point3 lookat, vec3 vup, double vfov, double aspect_ratio,
           double aperture = 0.0, double focus_dist = 1.0, double t0 = 0.0, double t1 = 0.0) {
        double theta = vfov * PI / 180.0;
        double h = std::tan(theta / 2.0);
        double viewport_height = 2.0 * h;
        double viewport_width = aspect_ratio * viewport_height;

        w = vec3_normalize(vec3_sub(lookfrom, lookat));
        u = vec3_normalize(vec3_cross(vup, w));
        v = vec3_cross(w, u);

        origin = lookfrom;
        horizontal = vec3_scale(u, focus_dist * viewport_width);
        vertical = vec3_scale(v, focus_dist * viewport_height);

        // lower_left = origin - horizontal/2 - vertical/2 - focus_dist * w
        lower_left_corner = vec3_sub(
            vec3_sub(
                vec3_sub(origin, vec3_scale(horizontal, 0.5)),
                vec3_scale(vertical, 0.5)
            ),
            vec3_scale(w, focus_dist)
        );

        lens_radius = aperture / 2.0;
        time0 = t0;
        time1 = t1;
    }

    /**
     * @brief Generate a ray for given screen coordinates
     * @param s Horizontal coordinate [0, 1]
     * @param t Vertical coordinate [0, 1], 0 at the bottom
     * @return Ray from a point on the lens through the focus plane
     */
    ray get_ray(double s, double t) const {
        vec3 rd = vec3_scale(random_in_unit_disk(), lens_radius);
        vec3 offset = vec3_add(vec3_scale(u, rd.x), vec3_scale(v, rd.y));
        point3 from = vec3_add(origin, offset);

        vec3 direction = vec3_sub(
            vec3_add(
                vec3_add(lower_left_corner, vec3_scale(horizontal, s)),
                vec3_scale(vertical, t)
            ),
            from
        );
        double time = time0 + random_double() * (time1 - time0);
        return ray_create_timed(from, direction, time);
    }
};

} // namespace pathtracer
