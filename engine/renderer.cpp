/**
 * @file renderer.cpp
 * @brief Implementation of the importance-sampled path tracer
 */

#include "renderer.hpp"
#include "pdf.hpp"
#include "profiler.hpp"
#include "random.hpp"
#include <stb_image_write.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <random>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace pathtracer {

namespace {

// Below this the estimator's division would blow up
constexpr double MIN_PDF = 1e-8;

} // namespace

// ==================== Image Output ====================

int to_byte(double linear) {
    // NaN fails both comparisons in clamp and would turn into garbage
    if (!(linear > 0.0)) {
        return 0;
    }
    double gamma = std::sqrt(std::min(linear, 1.0));
    return static_cast<int>(255.999 * gamma);
}

color Image::average() const {
    color sum = vec3_zero();
    for (const color& c : pixels) {
        sum = vec3_add(sum, c);
    }
    if (pixels.empty()) {
        return sum;
    }
    return vec3_scale(sum, 1.0 / static_cast<double>(pixels.size()));
}

bool Image::write_ppm(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "P3\n" << width << ' ' << height << "\n255\n";

    for (int y = height - 1; y >= 0; --y) {
        for (int x = 0; x < width; ++x) {
            color c = get_pixel(x, y);
            file << to_byte(c.x) << ' ' << to_byte(c.y) << ' ' << to_byte(c.z) << '\n';
        }
    }

    return static_cast<bool>(file);
}

bool Image::write_png(const std::string& filename) const {
    std::vector<unsigned char> data(static_cast<std::size_t>(width) * height * 3);

    for (int y = height - 1; y >= 0; --y) {
        // stb expects top-to-bottom
        std::size_t row = static_cast<std::size_t>(height - 1 - y);
        for (int x = 0; x < width; ++x) {
            color c = get_pixel(x, y);
            std::size_t idx = (row * width + x) * 3;
            data[idx + 0] = static_cast<unsigned char>(to_byte(c.x));
            data[idx + 1] = static_cast<unsigned char>(to_byte(c.y));
            data[idx + 2] = static_cast<unsigned char>(to_byte(c.z));
        }
    }

    return stbi_write_png(filename.c_str(), width, height, 3, data.data(), width * 3) != 0;
}

// ==================== Rendering ====================

Image Renderer::render(const Scene& scene, const Camera& camera) const {
    Image image(settings_.width, settings_.height);

    Timer total_timer;

    std::uint64_t base_seed = settings_.seed;
    if (base_seed == 0) {
        std::random_device rd;
        base_seed = (static_cast<std::uint64_t>(rd()) << 32) | rd();
    }

    // Passed to the loop only; the process-wide OpenMP default stays as it was
    int thread_count = 1;
#ifdef _OPENMP
    thread_count = settings_.threads > 0 ? settings_.threads : omp_get_max_threads();
#endif

    std::cout << "Rendering " << settings_.width << "x" << settings_.height
              << " (" << settings_.samples_per_pixel << " spp, max depth "
              << settings_.max_depth << ", " << scene.lights.size() << " light shapes)";
    std::cout << " using " << thread_count << " threads..." << std::endl;

    if (!scene.has_lights()) {
        std::cout << "Warning: scene has no light shapes; sampling materials only" << std::endl;
    }

    Timer render_timer;
    std::atomic<int> completed_lines{0};
    const int total_lines = settings_.height;

    #pragma omp parallel for schedule(dynamic, 1) num_threads(thread_count)
    for (int y = 0; y < settings_.height; ++y) {
        for (int x = 0; x < settings_.width; ++x) {
            image.set_pixel(x, y, render_pixel(scene, camera, x, y, base_seed));
        }
        Profiler::instance().count_camera_rays(
            static_cast<std::uint64_t>(settings_.width) * settings_.samples_per_pixel);

        int done = ++completed_lines;
        if (done % 50 == 0 || done == total_lines) {
            #pragma omp critical
            {
                std::cout << "\rProgress: " << (100 * done / total_lines) << "% ("
                          << done << "/" << total_lines << " lines)" << std::flush;
            }
        }
    }

    Profiler::instance().record("Pixel Rendering", Profiler::Duration(render_timer.elapsed_ms()));
    Profiler::instance().record("Total Render", Profiler::Duration(total_timer.elapsed_ms()));

    std::cout << "\nDone in " << total_timer.elapsed_sec() << " s (seed " << base_seed << ")"
              << std::endl;

    return image;
}

color Renderer::render_pixel(const Scene& scene, const Camera& camera, int x, int y,
                             std::uint64_t base_seed) const {
    PATHTRACER_PROFILE_SCOPE("Pixel");

    // Same pixel, same stream, whichever thread gets it
    seed_random(pixel_seed(base_seed, x, y));

    color pixel_color = vec3_zero();
    for (int s = 0; s < settings_.samples_per_pixel; ++s) {
        double u = (static_cast<double>(x) + random_double()) / settings_.width;
        double v = (static_cast<double>(y) + random_double()) / settings_.height;

        ray r = camera.get_ray(u, v);
        pixel_color = vec3_add(pixel_color, ray_color(r, scene, 0));
    }

    if (settings_.samples_per_pixel <= 0) {
        return pixel_color;
    }
    return vec3_scale(pixel_color, 1.0 / settings_.samples_per_pixel);
}

color Renderer::ray_color(ray r, const Scene& scene, int depth) const {
    hit_record rec = hit_record_init();

    if (!scene.hit(r, RAY_EPSILON, std::numeric_limits<double>::infinity(), rec)) {
        return settings_.background;
    }

    const Material& mat = scene.get_material(rec.material_id);
    color emitted = mat.emitted(r, rec);

    ScatterRecord srec;
    if (depth >= settings_.max_depth || !mat.scatter(r, rec, srec)) {
        return emitted;
    }

    if (srec.is_specular) {
        return vec3_mul(srec.attenuation, ray_color(srec.specular_ray, scene, depth + 1));
    }

    // Half the samples aim at the lights, half follow the material
    ray scattered;
    double pdf_val;
    if (scene.has_lights()) {
        HittablePdf light_pdf(scene.lights, rec.point);
        MixturePdf mixture(light_pdf, *srec.pdf);
        scattered = ray_create_timed(rec.point, mixture.generate(), r.time);
        pdf_val = mixture.value(scattered.direction);
    } else {
        scattered = ray_create_timed(rec.point, srec.pdf->generate(), r.time);
        pdf_val = srec.pdf->value(scattered.direction);
    }

    if (!(pdf_val > MIN_PDF) || !std::isfinite(pdf_val)) {
        Profiler::instance().count_skipped_sample();
        return emitted;
    }

    double scattering_pdf = mat.scattering_pdf(r, rec, scattered);
    if (scattering_pdf <= 0.0) {
        return emitted;
    }

    color incoming = ray_color(scattered, scene, depth + 1);
    color weighted = vec3_scale(vec3_mul(srec.attenuation, incoming), scattering_pdf / pdf_val);
    return vec3_add(emitted, weighted);
}

} // namespace pathtracer
