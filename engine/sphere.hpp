/**
 * @file sphere.hpp
 * @brief Sphere geometry and cone sampling toward it
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "hittable.hpp"
#include "onb.hpp"
#include "random.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace pathtracer {

/**
 * @brief Calculate UV coordinates for a point on a unit sphere
 * @param p Point on unit sphere (normalized direction from center)
 * @param u Output U coordinate [0, 1]
 * @param v Output V coordinate [0, 1]
 */
inline void get_sphere_uv(const vec3& p, double& u, double& v) {
    double theta = std::acos(std::clamp(-p.y, -1.0, 1.0));
    double phi = std::atan2(-p.z, p.x) + PI;

    u = phi / (2.0 * PI);
    v = theta / PI;
}

/**
 * @brief Sphere primitive
 */
class Sphere : public Hittable {
public:
    Sphere(point3 c, double r, int mat_id = 0)
        : center_(c), radius_(r), material_id_(mat_id) {}

    bool hit(ray r, double t_min, double t_max, hit_record& rec) const override {
        vec3 oc = vec3_sub(r.origin, center_);

        double a = vec3_length_squared(r.direction);
        double half_b = vec3_dot(oc, r.direction);
        double c = vec3_length_squared(oc) - radius_ * radius_;

        double discriminant = half_b * half_b - a * c;
        if (discriminant < 0) {
            return false;
        }

        double sqrtd = std::sqrt(discriminant);

        // Find the nearest root in the acceptable range
        double root = (-half_b - sqrtd) / a;
        if (root < t_min || root > t_max) {
            root = (-half_b + sqrtd) / a;
            if (root < t_min || root > t_max) {
                return false;
            }
        }

        rec.t = root;
        rec.point = ray_at(r, rec.t);
        vec3 outward_normal = vec3_scale(vec3_sub(rec.point, center_), 1.0 / radius_);
        hit_record_set_normal(&rec, r, outward_normal);
        rec.material_id = material_id_;
        get_sphere_uv(outward_normal, rec.u, rec.v);

        return true;
    }

    /**
     * @brief Density of random(): uniform over the cone subtending the sphere
     */
    double pdf_value(point3 origin, vec3 direction) const override {
        hit_record rec = hit_record_init();
        if (!hit(ray_create(origin, direction), RAY_EPSILON,
                 std::numeric_limits<double>::infinity(), rec)) {
            return 0.0;
        }

        double dist_sq = vec3_length_squared(vec3_sub(center_, origin));
        double cos_theta_max = std::sqrt(std::fmax(0.0, 1.0 - radius_ * radius_ / dist_sq));
        double solid_angle = 2.0 * PI * (1.0 - cos_theta_max);
        if (solid_angle <= 0.0) {
            return 0.0;
        }
        return 1.0 / solid_angle;
    }

    vec3 random(point3 origin) const override {
        vec3 direction = vec3_sub(center_, origin);
        double dist_sq = vec3_length_squared(direction);
        ONB uvw = ONB::from_w(direction);
        return uvw.local(random_to_sphere(radius_, dist_sq));
    }

private:
    point3 center_;
    double radius_;
    int material_id_;
};

} // namespace pathtracer
