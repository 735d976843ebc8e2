/**
 * @file main.cpp
 * @brief Entry point for the path tracer
 *
 * Renders a built-in scene chosen by name, with settings from an optional
 * JSON config file and command-line overrides.
 */

#include "config_loader.hpp"
#include "profiler.hpp"
#include "renderer.hpp"
#include "scenes.hpp"

#include <iostream>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pathtracer;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [config.json] [output.ppm|output.png] [options]" << std::endl;
    std::cout << "  config.json        - Render config (optional, defaults used if not provided)" << std::endl;
    std::cout << "  output             - Output file (optional, .png or .ppm)" << std::endl;
    std::cout << "  --scene NAME       - Built-in scene (default: cornell)" << std::endl;
    std::cout << "  --width N          - Image width in pixels" << std::endl;
    std::cout << "  --height N         - Image height in pixels" << std::endl;
    std::cout << "  --samples N        - Samples per pixel" << std::endl;
    std::cout << "  --max-depth N      - Path length cap" << std::endl;
    std::cout << "  --seed N           - Base random seed (0 = random)" << std::endl;
    std::cout << "  --threads N        - Worker threads (0 = all cores)" << std::endl;
    std::cout << "  --output FILE      - Output file" << std::endl;
    std::cout << "  --list-scenes      - List built-in scenes and exit" << std::endl;
    std::cout << "  -h, --help         - Show this help" << std::endl;
}

void list_scenes() {
    std::cout << "Built-in scenes:" << std::endl;
    for (const std::string& name : scene_names()) {
        std::cout << "  " << name << " - " << scene_description(name) << std::endl;
    }
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Values given on the command line; unset ones leave the config alone
 */
struct Overrides {
    std::optional<std::string> scene;
    std::optional<std::string> output;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> samples;
    std::optional<int> max_depth;
    std::optional<std::uint64_t> seed;
    std::optional<int> threads;
};

void apply_overrides(const Overrides& o, RenderConfig& config) {
    if (o.scene) config.scene = *o.scene;
    if (o.output) config.output = *o.output;
    if (o.width) config.render.width = *o.width;
    if (o.height) config.render.height = *o.height;
    if (o.samples) config.render.samples_per_pixel = *o.samples;
    if (o.max_depth) config.render.max_depth = *o.max_depth;
    if (o.seed) config.render.seed = *o.seed;
    if (o.threads) config.render.threads = *o.threads;
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "=== Path Tracer ===" << std::endl;

    Overrides overrides;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }

            if (arg == "--list-scenes") {
                list_scenes();
                return 0;
            }

            bool takes_value = arg == "--scene" || arg == "--output" || arg == "--width" ||
                               arg == "--height" || arg == "--samples" || arg == "--max-depth" ||
                               arg == "--seed" || arg == "--threads";
            if (takes_value) {
                if (i + 1 >= argc) {
                    std::cerr << "Error: " << arg << " needs a value" << std::endl;
                    return 1;
                }
                std::string value = argv[++i];

                if (arg == "--scene") overrides.scene = value;
                else if (arg == "--output") overrides.output = value;
                else if (arg == "--width") overrides.width = std::stoi(value);
                else if (arg == "--height") overrides.height = std::stoi(value);
                else if (arg == "--samples") overrides.samples = std::stoi(value);
                else if (arg == "--max-depth") overrides.max_depth = std::stoi(value);
                else if (arg == "--seed") {
                    std::uint64_t seed = 0;
                    if (!ConfigLoader::parse_seed(value, seed)) {
                        return 1;
                    }
                    overrides.seed = seed;
                }
                else if (arg == "--threads") overrides.threads = std::stoi(value);
                continue;
            }

            if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Error: Unknown option " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }

            positional.push_back(arg);
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Expected a number (" << e.what() << ")" << std::endl;
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Error: Number out of range (" << e.what() << ")" << std::endl;
        return 1;
    }

    if (positional.size() > 2) {
        std::cerr << "Error: Too many arguments" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    RenderConfig config;

    // A lone positional that is not JSON is taken as the output file
    std::string config_file;
    std::string output_arg;
    if (positional.size() == 2) {
        config_file = positional[0];
        output_arg = positional[1];
    } else if (positional.size() == 1) {
        if (ends_with(positional[0], ".json")) {
            config_file = positional[0];
        } else {
            output_arg = positional[0];
        }
    }

    if (!config_file.empty()) {
        std::cout << "Loading config: " << config_file << std::endl;
        if (!ConfigLoader::load(config_file, config)) {
            return 1;
        }
    }
    if (!output_arg.empty()) {
        config.output = output_arg;
    }
    apply_overrides(overrides, config);

    if (!ConfigLoader::validate(config)) {
        return 1;
    }

    double aspect_ratio = static_cast<double>(config.render.width) / config.render.height;

    Profiler::instance().reset();

    Timer setup_timer;
    SceneData data;
    if (!make_scene(config.scene, aspect_ratio, data)) {
        std::cerr << "Error: Unknown scene '" << config.scene << "'" << std::endl;
        list_scenes();
        return 1;
    }
    std::cout << "Scene: " << config.scene << " (" << data.scene.world.size() << " objects, "
              << data.scene.materials.size() << " materials)" << std::endl;
    Profiler::instance().record("Scene Setup", Profiler::Duration(setup_timer.elapsed_ms()));

    Renderer renderer(config.render);
    Image image = renderer.render(data.scene, data.camera);

    color mean = image.average();
    std::cout << "Mean radiance: (" << mean.x << ", " << mean.y << ", " << mean.z << ")" << std::endl;

    Timer output_timer;
    bool success = false;
    if (ends_with(config.output, ".png")) {
        success = image.write_png(config.output);
    } else {
        success = image.write_ppm(config.output);
    }
    Profiler::instance().record("Image Output", Profiler::Duration(output_timer.elapsed_ms()));
    Profiler::instance().report();

    if (success) {
        std::cout << "Image saved to: " << config.output << std::endl;
    } else {
        std::cerr << "Error: Failed to save image to " << config.output << std::endl;
        return 1;
    }

    return 0;
}
