/**
 * @file texture.hpp
 * @brief Procedural color textures for albedo and emission
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include <cmath>

namespace pathtracer {

enum class TextureType {
    Constant,   // Same color everywhere
    Checker     // Alternating cubes in world space
};

/**
 * @brief Color lookup by world position and surface coordinates
 *
 * Kept as a small value type so materials can be stored by value in the
 * scene's material table.
 */
struct Texture {
    TextureType type = TextureType::Constant;
    color even = {1.0, 1.0, 1.0};  // Constant color, or cells with even index sum
    color odd = {0.0, 0.0, 0.0};   // Cells with odd index sum
    double cell_size = 1.0;        // Checker cube edge in world units

    /**
     * @brief Create a constant color texture
     */
    static Texture solid(color c) {
        Texture tex;
        tex.type = TextureType::Constant;
        tex.even = c;
        return tex;
    }

    /**
     * @brief Create a 3D checker texture
     * @param even_color Color of the cell containing the origin
     * @param odd_color Color of its neighbours
     * @param cell_size Cube edge length
     */
    static Texture checker(color even_color, color odd_color, double cell_size = 10.0) {
        Texture tex;
        tex.type = TextureType::Checker;
        tex.even = even_color;
        tex.odd = odd_color;
        tex.cell_size = cell_size;
        return tex;
    }

    /**
     * @brief Look up the color at a hit
     * @param p World position
     * @param u Surface U coordinate (unused by the current types)
     * @param v Surface V coordinate (unused by the current types)
     */
    color sample(point3 p, double u = 0.0, double v = 0.0) const {
        (void)u;
        (void)v;
        if (type == TextureType::Constant) {
            return even;
        }

        long long cell = static_cast<long long>(std::floor(p.x / cell_size))
                       + static_cast<long long>(std::floor(p.y / cell_size))
                       + static_cast<long long>(std::floor(p.z / cell_size));
        return (cell & 1) == 0 ? even : odd;
    }
};

} // namespace pathtracer
