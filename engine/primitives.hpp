/**
 * @file primitives.hpp
 * @brief Axis-aligned rectangle and box primitives
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "hittable.hpp"
#include "transform.hpp"
#include "random.hpp"
#include <cmath>
#include <limits>
#include <memory>

namespace pathtracer {

/**
 * @brief Plane an AARect lies in
 *
 * The two in-plane axes are (a, b) in the order of the name, and the
 * rectangle sits at a fixed coordinate k on the remaining axis:
 * XY -> (x, y) at z = k, YZ -> (y, z) at x = k, ZX -> (z, x) at y = k.
 */
enum class Plane {
    XY,
    YZ,
    ZX
};

/**
 * @brief Rectangle on a coordinate plane
 *
 * The normal points along the positive fixed axis; wrap in FlipNormals to
 * face the other way.
 */
class AARect : public Hittable {
public:
    AARect(Plane plane, double a0, double a1, double b0, double b1, double k, int mat_id = 0)
        : a0_(a0), a1_(a1), b0_(b0), b1_(b1), k_(k), material_id_(mat_id) {
        switch (plane) {
            case Plane::XY: a_axis_ = 0; b_axis_ = 1; k_axis_ = 2; break;
            case Plane::YZ: a_axis_ = 1; b_axis_ = 2; k_axis_ = 0; break;
            case Plane::ZX: a_axis_ = 2; b_axis_ = 0; k_axis_ = 1; break;
        }
        normal_ = vec3_with_axis(vec3_zero(), k_axis_, 1.0);
    }

    double area() const { return (a1_ - a0_) * (b1_ - b0_); }

    bool hit(ray r, double t_min, double t_max, hit_record& rec) const override {
        double denom = vec3_axis(r.direction, k_axis_);

        // Ray is parallel to the plane
        if (std::fabs(denom) < 1e-12) {
            return false;
        }

        double t = (k_ - vec3_axis(r.origin, k_axis_)) / denom;
        if (t < t_min || t > t_max) {
            return false;
        }

        point3 p = ray_at(r, t);
        double a = vec3_axis(p, a_axis_);
        double b = vec3_axis(p, b_axis_);
        if (a < a0_ || a > a1_ || b < b0_ || b > b1_) {
            return false;
        }

        rec.t = t;
        rec.point = vec3_with_axis(p, k_axis_, k_);
        rec.u = (a - a0_) / (a1_ - a0_);
        rec.v = (b - b0_) / (b1_ - b0_);
        hit_record_set_normal(&rec, r, normal_);
        rec.material_id = material_id_;

        return true;
    }

    /**
     * @brief Solid-angle density of uniform area sampling seen from origin
     *
     * Converts the area density 1/A with distance^2 / (|cos_light| * A).
     */
    double pdf_value(point3 origin, vec3 direction) const override {
        hit_record rec = hit_record_init();
        if (!hit(ray_create(origin, direction), RAY_EPSILON,
                 std::numeric_limits<double>::infinity(), rec)) {
            return 0.0;
        }

        double distance_squared = rec.t * rec.t * vec3_length_squared(direction);
        double cosine = std::fabs(vec3_dot(direction, rec.normal)) / vec3_length(direction);
        if (cosine <= 0.0) {
            return 0.0;
        }

        return distance_squared / (cosine * area());
    }

    vec3 random(point3 origin) const override {
        vec3 p = vec3_with_axis(vec3_zero(), a_axis_, random_double(a0_, a1_));
        p = vec3_with_axis(p, b_axis_, random_double(b0_, b1_));
        p = vec3_with_axis(p, k_axis_, k_);
        return vec3_sub(p, origin);
    }

private:
    double a0_, a1_, b0_, b1_, k_;
    int a_axis_ = 0;
    int b_axis_ = 1;
    int k_axis_ = 2;
    vec3 normal_ = {0, 0, 1};
    int material_id_;
};

/**
 * @brief Axis-aligned box built from six rectangles
 *
 * Faces on the max corner face outward as constructed; faces on the min
 * corner are flipped so every normal points out of the box.
 */
class Box : public Hittable {
public:
    Box(point3 p0, point3 p1, int mat_id = 0) {
        faces_.add(std::make_shared<AARect>(Plane::XY, p0.x, p1.x, p0.y, p1.y, p1.z, mat_id));
        faces_.add(std::make_shared<FlipNormals>(
            std::make_shared<AARect>(Plane::XY, p0.x, p1.x, p0.y, p1.y, p0.z, mat_id)));

        faces_.add(std::make_shared<AARect>(Plane::ZX, p0.z, p1.z, p0.x, p1.x, p1.y, mat_id));
        faces_.add(std::make_shared<FlipNormals>(
            std::make_shared<AARect>(Plane::ZX, p0.z, p1.z, p0.x, p1.x, p0.y, mat_id)));

        faces_.add(std::make_shared<AARect>(Plane::YZ, p0.y, p1.y, p0.z, p1.z, p1.x, mat_id));
        faces_.add(std::make_shared<FlipNormals>(
            std::make_shared<AARect>(Plane::YZ, p0.y, p1.y, p0.z, p1.z, p0.x, mat_id)));
    }

    bool hit(ray r, double t_min, double t_max, hit_record& rec) const override {
        return faces_.hit(r, t_min, t_max, rec);
    }

private:
    HittableList faces_;
};

} // namespace pathtracer
