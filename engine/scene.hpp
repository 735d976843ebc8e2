/**
 * @file scene.hpp
 * @brief Scene management for path tracing
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "hittable.hpp"
#include "material.hpp"
#include <memory>
#include <vector>

namespace pathtracer {

/**
 * @brief Scene containing objects, light sampling targets and materials
 *
 * Built once, then shared read-only by every render thread. Hit records
 * refer to materials by index into the material table.
 */
class Scene {
public:
    std::vector<Material> materials;
    HittableList world;   // Everything a ray can hit
    HittableList lights;  // Shapes the integrator aims samples at

    /**
     * @brief Add a material and return its ID
     */
    int add_material(const Material& mat) {
        int id = static_cast<int>(materials.size());
        materials.push_back(mat);
        return id;
    }

    /**
     * @brief Add a shape to the scene
     */
    void add(std::shared_ptr<Hittable> object) {
        world.add(std::move(object));
    }

    /**
     * @brief Register a shape as a light sampling target
     *
     * The shape is not added to the world; pass the same pointer to add()
     * as well if it should also be visible.
     */
    void add_light(std::shared_ptr<Hittable> object) {
        lights.add(std::move(object));
    }

    bool has_lights() const { return !lights.empty(); }

    /**
     * @brief Closest hit over the whole scene
     * @param r The ray
     * @param t_min Minimum t value
     * @param t_max Maximum t value
     * @param rec Hit record to populate
     * @return true if any intersection found
     */
    bool hit(ray r, double t_min, double t_max, hit_record& rec) const {
        return world.hit(r, t_min, t_max, rec);
    }

    /**
     * @brief Get material by ID
     */
    const Material& get_material(int id) const {
        return materials[static_cast<std::size_t>(id)];
    }
};

} // namespace pathtracer
