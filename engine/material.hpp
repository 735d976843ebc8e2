/**
 * @file material.hpp
 * @brief Material definitions and scattering
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "pdf.hpp"
#include "random.hpp"
#include "texture.hpp"
#include <cmath>
#include <memory>

namespace pathtracer {

/**
 * @brief Material types supported by the renderer
 */
enum class MaterialType {
    Lambertian,   // Diffuse material
    Metal,        // Reflective material
    Dielectric,   // Transparent/refractive material
    DiffuseLight  // One-sided area emitter
};

/**
 * @brief Result of a successful scatter
 *
 * Specular events carry one deterministic outgoing ray and bypass light
 * sampling. Diffuse events carry a direction distribution instead and go
 * through the MIS mixture.
 */
struct ScatterRecord {
    bool is_specular = false;
    ray specular_ray = {};
    color attenuation = {1.0, 1.0, 1.0};
    std::unique_ptr<Pdf> pdf;  // Set only when !is_specular
};

/**
 * @brief Material properties
 */
struct Material {
    MaterialType type = MaterialType::Lambertian;
    Texture albedo = Texture::solid({0.5, 0.5, 0.5});  // Reflectance (Lambertian, Metal)
    Texture emission = Texture::solid({0.0, 0.0, 0.0}); // Radiance (DiffuseLight)
    double fuzz = 0.0;                // Metal roughness (0 = mirror)
    double refraction_index = 1.5;    // Index of refraction for dielectrics

    /**
     * @brief Check if material is emissive
     */
    bool is_emissive() const {
        return type == MaterialType::DiffuseLight;
    }

    /**
     * @brief Scatter a ray and return scatter record
     * @param r_in Incoming ray
     * @param rec Hit record
     * @param srec Output scatter record
     * @return true if ray scatters, false if absorbed
     */
    bool scatter(ray r_in, const hit_record& rec, ScatterRecord& srec) const {
        switch (type) {
            case MaterialType::Lambertian: {
                srec.is_specular = false;
                srec.attenuation = albedo.sample(rec.point, rec.u, rec.v);
                srec.pdf = std::make_unique<CosinePdf>(rec.normal);
                return true;
            }

            case MaterialType::Metal: {
                vec3 reflected = vec3_reflect(vec3_normalize(r_in.direction), rec.normal);
                if (fuzz > 0.0) {
                    reflected = vec3_add(reflected, vec3_scale(random_in_unit_sphere(), fuzz));
                }

                srec.is_specular = true;
                srec.specular_ray = ray_create_timed(rec.point, reflected, r_in.time);
                srec.attenuation = albedo.sample(rec.point, rec.u, rec.v);
                srec.pdf.reset();
                return vec3_dot(reflected, rec.normal) > 0;
            }

            case MaterialType::Dielectric: {
                srec.is_specular = true;
                srec.attenuation = {1.0, 1.0, 1.0};
                srec.pdf.reset();

                // Normal is outward; leaving the medium flips it and the ratio
                double refraction_ratio = rec.front_face ?
                    (1.0 / refraction_index) : refraction_index;
                vec3 facing_normal = rec.front_face ? rec.normal : vec3_negate(rec.normal);

                vec3 unit_direction = vec3_normalize(r_in.direction);
                double cos_theta = std::fmin(vec3_dot(vec3_negate(unit_direction), facing_normal), 1.0);

                vec3 direction;
                double reflect_prob = reflect_probability(cos_theta, rec.front_face, refraction_index);

                if (reflect_prob > random_double()) {
                    direction = vec3_reflect(unit_direction, facing_normal);
                } else {
                    direction = vec3_refract(unit_direction, facing_normal, refraction_ratio);
                }

                srec.specular_ray = ray_create_timed(rec.point, direction, r_in.time);
                return true;
            }

            case MaterialType::DiffuseLight:
                return false;
        }
        return false;
    }

    /**
     * @brief Density the material itself assigns to a scattered direction
     * @param r_in Incoming ray
     * @param rec Hit record
     * @param scattered Scattered ray
     * @return cos/PI for Lambertian; 0 for delta and emissive materials
     */
    double scattering_pdf(ray r_in, const hit_record& rec, ray scattered) const {
        (void)r_in;
        switch (type) {
            case MaterialType::Lambertian: {
                double cosine = vec3_dot(rec.normal, vec3_normalize(scattered.direction));
                return cosine < 0 ? 0 : cosine * INV_PI;
            }
            case MaterialType::Metal:
            case MaterialType::Dielectric:
            case MaterialType::DiffuseLight:
                return 0.0;
        }
        return 0.0;
    }

    /**
     * @brief Radiance emitted toward the incoming ray
     *
     * Lights only emit from the side their normal points to.
     */
    color emitted(ray r_in, const hit_record& rec) const {
        if (type != MaterialType::DiffuseLight) {
            return vec3_zero();
        }
        if (vec3_dot(rec.normal, r_in.direction) < 0.0) {
            return emission.sample(rec.point, rec.u, rec.v);
        }
        return vec3_zero();
    }

    /**
     * @brief Create a Lambertian (diffuse) material
     */
    static Material lambertian(color c) {
        return lambertian_textured(Texture::solid(c));
    }

    /**
     * @brief Create a Lambertian material with a texture
     */
    static Material lambertian_textured(Texture tex) {
        Material m;
        m.type = MaterialType::Lambertian;
        m.albedo = tex;
        return m;
    }

    /**
     * @brief Create a metal (reflective) material
     */
    static Material metal(color c, double fuzz_factor = 0.0) {
        Material m;
        m.type = MaterialType::Metal;
        m.albedo = Texture::solid(c);
        m.fuzz = fuzz_factor < 1.0 ? (fuzz_factor > 0.0 ? fuzz_factor : 0.0) : 1.0;
        return m;
    }

    /**
     * @brief Create a dielectric (glass-like) material
     */
    static Material dielectric(double ir) {
        Material m;
        m.type = MaterialType::Dielectric;
        m.albedo = Texture::solid({1.0, 1.0, 1.0});
        m.refraction_index = ir;
        return m;
    }

    /**
     * @brief Create an emissive (area light) material
     */
    static Material diffuse_light(color emit) {
        Material m;
        m.type = MaterialType::DiffuseLight;
        m.albedo = Texture::solid({0.0, 0.0, 0.0});
        m.emission = Texture::solid(emit);
        return m;
    }

    /**
     * @brief Chance that a dielectric reflects instead of refracting
     * @param cos_theta Cosine between the incoming ray and the facing normal
     * @param entering True when the ray arrives from outside the medium
     * @param ref_idx Refractive index of the medium
     * @return 1 under total internal reflection, otherwise Schlick reflectance.
     *         Leaving the medium, Schlick is evaluated at ref_idx * cos_theta.
     */
    static double reflect_probability(double cos_theta, bool entering, double ref_idx) {
        double ratio = entering ? (1.0 / ref_idx) : ref_idx;
        double sin_theta = std::sqrt(std::fmax(0.0, 1.0 - cos_theta * cos_theta));
        if (ratio * sin_theta > 1.0) {
            return 1.0;
        }
        return reflectance(entering ? cos_theta : ref_idx * cos_theta, ref_idx);
    }

    /**
     * @brief Schlick's approximation for reflectance
     *
     * A matched index means there is no interface at all, so nothing is
     * reflected at any angle.
     */
    static double reflectance(double cosine, double ref_idx) {
        if (ref_idx == 1.0) {
            return 0.0;
        }
        auto r0 = (1.0 - ref_idx) / (1.0 + ref_idx);
        r0 = r0 * r0;
        return r0 + (1.0 - r0) * std::pow((1.0 - cosine), 5.0);
    }
};

} // namespace pathtracer
