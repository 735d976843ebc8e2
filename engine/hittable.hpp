/**
 * @file hittable.hpp
 * @brief Intersectable geometry interface and the flat scene aggregate
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "random.hpp"
#include <memory>
#include <vector>
#include <cstddef>

namespace pathtracer {

// Lower bound for secondary rays; keeps a surface from re-hitting itself
constexpr double RAY_EPSILON = 0.001;

/**
 * @brief Anything a ray can hit
 *
 * hit() must report the nearest intersection with t in [t_min, t_max].
 * Shapes that can act as light sources also implement pdf_value() and
 * random() so the integrator can aim samples at them.
 */
class Hittable {
public:
    virtual ~Hittable() = default;

    /**
     * @brief Test ray intersection
     * @param r The ray
     * @param t_min Minimum t value
     * @param t_max Maximum t value
     * @param rec Hit record to populate (left untouched on a miss)
     * @return true if intersection found
     */
    virtual bool hit(ray r, double t_min, double t_max, hit_record& rec) const = 0;

    /**
     * @brief Solid-angle density of random() for a direction from origin
     */
    virtual double pdf_value(point3 origin, vec3 direction) const {
        (void)origin;
        (void)direction;
        return 0.0;
    }

    /**
     * @brief Direction from origin toward a random point of the shape
     */
    virtual vec3 random(point3 origin) const {
        (void)origin;
        return {1.0, 0.0, 0.0};
    }
};

/**
 * @brief Insertion-ordered list of shapes, tested exhaustively
 */
class HittableList : public Hittable {
public:
    HittableList() = default;
    explicit HittableList(std::shared_ptr<Hittable> object) { add(std::move(object)); }

    void add(std::shared_ptr<Hittable> object) {
        objects_.push_back(std::move(object));
    }

    bool empty() const { return objects_.empty(); }
    std::size_t size() const { return objects_.size(); }

    bool hit(ray r, double t_min, double t_max, hit_record& rec) const override {
        hit_record temp_rec = hit_record_init();
        bool hit_anything = false;
        double closest_so_far = t_max;

        for (const auto& object : objects_) {
            if (object->hit(r, t_min, closest_so_far, temp_rec)) {
                hit_anything = true;
                closest_so_far = temp_rec.t;
                rec = temp_rec;
            }
        }

        return hit_anything;
    }

    // Mean of the members' densities: each member is picked with equal odds
    double pdf_value(point3 origin, vec3 direction) const override {
        if (objects_.empty()) {
            return 0.0;
        }

        double weight = 1.0 / static_cast<double>(objects_.size());
        double sum = 0.0;
        for (const auto& object : objects_) {
            sum += weight * object->pdf_value(origin, direction);
        }
        return sum;
    }

    vec3 random(point3 origin) const override {
        if (objects_.empty()) {
            return {1.0, 0.0, 0.0};
        }

        auto index = static_cast<std::size_t>(random_double() * static_cast<double>(objects_.size()));
        if (index >= objects_.size()) index = objects_.size() - 1;
        return objects_[index]->random(origin);
    }

private:
    std::vector<std::shared_ptr<Hittable>> objects_;
};

} // namespace pathtracer
