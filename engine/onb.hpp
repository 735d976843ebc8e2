/**
 * @file onb.hpp
 * @brief Orthonormal basis for hemispherical sampling
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include <cmath>

namespace pathtracer {

/**
 * @brief Right-handed local frame (u, v, w) built around a single direction
 *
 * Local samples generated around +Z are carried into world space with
 * local(), so w plays the role of the surface normal.
 */
struct ONB {
    vec3 u;
    vec3 v;
    vec3 w;

    /**
     * @brief Build the frame with w along the given direction
     * @param n Direction (any nonzero length)
     */
    static ONB from_w(vec3 n) {
        ONB basis;
        basis.w = vec3_normalize(n);
        // Pick a helper axis that is not nearly parallel to w
        vec3 a = (std::fabs(basis.w.x) > 0.9) ? vec3{0, 1, 0} : vec3{1, 0, 0};
        basis.v = vec3_normalize(vec3_cross(basis.w, a));
        basis.u = vec3_cross(basis.v, basis.w);
        return basis;
    }

    vec3 local(double a, double b, double c) const {
        return vec3_add(vec3_add(vec3_scale(u, a), vec3_scale(v, b)), vec3_scale(w, c));
    }

    vec3 local(vec3 a) const {
        return local(a.x, a.y, a.z);
    }
};

} // namespace pathtracer
