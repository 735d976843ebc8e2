/**
 * @file transform.hpp
 * @brief Instancing wrappers: translation, axis rotation, normal flip
 *
 * Each wrapper moves the query into the child's local frame, lets the
 * child intersect, and moves the result back. The ray parameter t is
 * never rescaled, so the caller's [t_min, t_max] means the same thing on
 * both sides.
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "hittable.hpp"
#include "random.hpp"
#include <cmath>
#include <memory>

namespace pathtracer {

/**
 * @brief Coordinate axis for Rotate
 */
enum class Axis {
    X,
    Y,
    Z
};

/**
 * @brief Reverse the reported normal of the wrapped shape
 *
 * Used to turn the front of a rectangle inward for room walls.
 */
class FlipNormals : public Hittable {
public:
    explicit FlipNormals(std::shared_ptr<Hittable> object)
        : object_(std::move(object)) {}

    bool hit(ray r, double t_min, double t_max, hit_record& rec) const override {
        if (!object_->hit(r, t_min, t_max, rec)) {
            return false;
        }
        hit_record_flip_normal(&rec);
        return true;
    }

    double pdf_value(point3 origin, vec3 direction) const override {
        return object_->pdf_value(origin, direction);
    }

    vec3 random(point3 origin) const override {
        return object_->random(origin);
    }

private:
    std::shared_ptr<Hittable> object_;
};

/**
 * @brief Displace the wrapped shape by a fixed offset
 */
class Translate : public Hittable {
public:
    Translate(std::shared_ptr<Hittable> object, vec3 offset)
        : object_(std::move(object)), offset_(offset) {}

    bool hit(ray r, double t_min, double t_max, hit_record& rec) const override {
        ray moved = ray_create_timed(vec3_sub(r.origin, offset_), r.direction, r.time);
        if (!object_->hit(moved, t_min, t_max, rec)) {
            return false;
        }
        rec.point = vec3_add(rec.point, offset_);
        return true;
    }

    double pdf_value(point3 origin, vec3 direction) const override {
        return object_->pdf_value(vec3_sub(origin, offset_), direction);
    }

    vec3 random(point3 origin) const override {
        return object_->random(vec3_sub(origin, offset_));
    }

private:
    std::shared_ptr<Hittable> object_;
    vec3 offset_;
};

/**
 * @brief Rotate the wrapped shape about a coordinate axis through the origin
 *
 * Positive angles turn counter-clockwise looking down the axis toward the
 * origin (right-hand rule).
 */
class Rotate : public Hittable {
public:
    /**
     * @param object Shape to rotate
     * @param axis Rotation axis
     * @param degrees Rotation angle in degrees
     */
    Rotate(std::shared_ptr<Hittable> object, Axis axis, double degrees)
        : object_(std::move(object)) {
        double radians = degrees * PI / 180.0;
        sin_theta_ = std::sin(radians);
        cos_theta_ = std::cos(radians);

        // (i, j) spans the plane of rotation, ordered so i x j = axis
        switch (axis) {
            case Axis::X: i_ = 1; j_ = 2; break;
            case Axis::Y: i_ = 2; j_ = 0; break;
            case Axis::Z: i_ = 0; j_ = 1; break;
        }
    }

    bool hit(ray r, double t_min, double t_max, hit_record& rec) const override {
        ray local = ray_create_timed(to_local(r.origin), to_local(r.direction), r.time);
        if (!object_->hit(local, t_min, t_max, rec)) {
            return false;
        }
        rec.point = to_world(rec.point);
        rec.normal = to_world(rec.normal);
        return true;
    }

    double pdf_value(point3 origin, vec3 direction) const override {
        return object_->pdf_value(to_local(origin), to_local(direction));
    }

    vec3 random(point3 origin) const override {
        return to_world(object_->random(to_local(origin)));
    }

private:
    vec3 rotate(vec3 p, double sin_theta) const {
        double a = vec3_axis(p, i_);
        double b = vec3_axis(p, j_);
        vec3 out = vec3_with_axis(p, i_, cos_theta_ * a - sin_theta * b);
        return vec3_with_axis(out, j_, sin_theta * a + cos_theta_ * b);
    }

    vec3 to_local(vec3 p) const { return rotate(p, -sin_theta_); }
    vec3 to_world(vec3 p) const { return rotate(p, sin_theta_); }

    std::shared_ptr<Hittable> object_;
    double sin_theta_ = 0.0;
    double cos_theta_ = 1.0;
    int i_ = 2;
    int j_ = 0;
};

} // namespace pathtracer
