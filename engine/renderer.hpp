/**
 * @file renderer.hpp
 * @brief Monte Carlo path tracer with light/BRDF multiple importance sampling
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
#include "../core/ray.h"
#include "../core/hit.h"
}

#include "camera.hpp"
#include "scene.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pathtracer {

/**
 * @brief Image buffer of linear radiance
 *
 * Row 0 is the bottom of the picture, matching the camera's t = 0.
 */
struct Image {
    int width;
    int height;
    std::vector<color> pixels;

    Image(int w, int h) : width(w), height(h), pixels(static_cast<std::size_t>(w) * h) {}

    /**
     * @brief Set pixel color
     */
    void set_pixel(int x, int y, color c) {
        pixels[static_cast<std::size_t>(y) * width + x] = c;
    }

    /**
     * @brief Get pixel color
     */
    color get_pixel(int x, int y) const {
        return pixels[static_cast<std::size_t>(y) * width + x];
    }

    /**
     * @brief Mean radiance over all pixels
     */
    color average() const;

    /**
     * @brief Write image to PPM (P3) file, top row first
     * @param filename Output filename
     * @return true on success
     */
    bool write_ppm(const std::string& filename) const;

    /**
     * @brief Write image to PNG file
     * @param filename Output filename
     * @return true on success
     */
    bool write_png(const std::string& filename) const;
};

/**
 * @brief Gamma-correct (gamma 2), clamp and quantize one channel to 0..255
 */
int to_byte(double linear);

/**
 * @brief Path tracing renderer
 */
class Renderer {
public:
    /**
     * @brief Render settings
     */
    struct Settings {
        int width = 500;
        int height = 500;
        int samples_per_pixel = 100;
        int max_depth = 1000;          // Path length cap
        std::uint64_t seed = 0;        // Base seed for per-pixel streams (0 = random)
        int threads = 0;               // Worker threads (0 = OpenMP default)
        color background = {0.0, 0.0, 0.0};  // Radiance of rays that escape
    };

    Renderer() = default;
    explicit Renderer(const Settings& settings) : settings_(settings) {}

    /**
     * @brief Render a scene
     * @param scene The scene to render
     * @param camera The camera to use
     * @return Rendered image (linear radiance)
     */
    Image render(const Scene& scene, const Camera& camera) const;

    /**
     * @brief Average all samples of one pixel
     * @param base_seed Seed the pixel's private stream is derived from
     */
    color render_pixel(const Scene& scene, const Camera& camera, int x, int y,
                       std::uint64_t base_seed) const;

    /**
     * @brief Estimate radiance arriving along a ray
     * @param r The ray
     * @param scene Scene to trace against
     * @param depth Number of bounces already taken
     */
    color ray_color(ray r, const Scene& scene, int depth) const;

    /**
     * @brief Get/set settings
     */
    Settings& settings() { return settings_; }
    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
};

} // namespace pathtracer
