/**
 * @file hit.h
 * @brief Hit record structure for ray-object intersections
 */

#ifndef HIT_H
#define HIT_H

#include "vec3.h"
#include "ray.h"
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Hit record containing intersection information
 *
 * The normal is the geometric normal of the surface as the shape (and any
 * wrapping transforms) report it. It is not turned toward the ray, so
 * one-sided emitters and dielectrics can tell which side was hit.
 */
typedef struct hit_record {
    point3 point;      /**< Point of intersection */
    vec3 normal;       /**< Surface normal at intersection (outward) */
    double t;          /**< Ray parameter at intersection */
    double u;          /**< Texture U coordinate */
    double v;          /**< Texture V coordinate */
    bool front_face;   /**< True if the ray arrived against the normal */
    int material_id;   /**< Material identifier for the hit surface */
} hit_record;

/**
 * @brief Initialize a hit record
 * @return Default hit record
 */
hit_record hit_record_init(void);

/**
 * @brief Store the outward normal and classify the hit side
 *
 * front_face is set when the ray direction opposes the normal. The normal
 * itself is stored unchanged.
 *
 * @param rec Hit record to modify
 * @param r The ray
 * @param outward_normal The outward-pointing surface normal
 */
void hit_record_set_normal(hit_record* rec, ray r, vec3 outward_normal);

/**
 * @brief Negate the stored normal and toggle front_face
 * @param rec Hit record to modify
 */
void hit_record_flip_normal(hit_record* rec);

#ifdef __cplusplus
}
#endif

#endif /* HIT_H */
