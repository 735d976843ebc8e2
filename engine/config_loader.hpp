/**
 * @file config_loader.hpp
 * @brief JSON render configuration loading
 */

#pragma once

#include "renderer.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pathtracer {

using json = nlohmann::json;

/**
 * @brief Everything needed to run one render
 */
struct RenderConfig {
    std::string scene = "cornell";
    std::string output = "output.ppm";
    Renderer::Settings render;
};

/**
 * @brief Load a render configuration from a JSON file
 *
 * Every key is optional; missing keys keep the values already in the
 * config, so CLI defaults can be layered underneath a file.
 */
class ConfigLoader {
public:
    /**
     * @brief Load config from JSON file
     * @param filename Path to JSON file
     * @param config Config to update in place
     * @return true on success; on failure an error is printed and config
     *         may be partially updated
     */
    static bool load(const std::string& filename, RenderConfig& config) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open config file: " << filename << std::endl;
            return false;
        }

        json j;
        try {
            file >> j;
        } catch (const json::parse_error& e) {
            std::cerr << "Error parsing JSON: " << e.what() << std::endl;
            return false;
        }

        try {
            return apply(j, config);
        } catch (const json::type_error& e) {
            std::cerr << "Error: Wrong value type in " << filename << ": " << e.what() << std::endl;
            return false;
        }
    }

    /**
     * @brief Apply an already parsed document
     * @throws json::type_error if a key holds the wrong kind of value
     */
    static bool apply(const json& j, RenderConfig& config) {
        if (!j.is_object()) {
            std::cerr << "Error: Config root must be an object" << std::endl;
            return false;
        }

        config.scene = j.value("scene", config.scene);

        if (j.contains("render")) {
            const json& r = j["render"];
            Renderer::Settings& s = config.render;

            s.width = r.value("width", s.width);
            s.height = r.value("height", s.height);
            s.samples_per_pixel = r.value("samples", s.samples_per_pixel);
            s.max_depth = r.value("max_depth", s.max_depth);
            if (r.contains("seed")) {
                // Plain get<uint64_t> would wrap a negative seed
                if (!r["seed"].is_number_unsigned()) {
                    std::cerr << "Error: 'seed' must be a non-negative integer" << std::endl;
                    return false;
                }
                s.seed = r["seed"].get<std::uint64_t>();
            }
            s.threads = r.value("threads", s.threads);
            config.output = r.value("output", config.output);

            if (r.contains("background")) {
                auto bg = r["background"].get<std::vector<double>>();
                if (bg.size() != 3) {
                    std::cerr << "Error: 'background' needs 3 components, got "
                              << bg.size() << std::endl;
                    return false;
                }
                s.background = {bg[0], bg[1], bg[2]};
            }
        }

        return validate(config);
    }

    /**
     * @brief Parse a base seed given as text
     * @param text Decimal digits only; signs and trailing characters are rejected
     * @param seed Set on success
     * @return true on success; on failure an error is printed and seed is unchanged
     */
    static bool parse_seed(const std::string& text, std::uint64_t& seed) {
        // std::stoull accepts "-5" and negates it modulo 2^64
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            std::cerr << "Error: Seed must be a non-negative integer, got '" << text << "'" << std::endl;
            return false;
        }

        try {
            seed = std::stoull(text);
        } catch (const std::out_of_range&) {
            std::cerr << "Error: Seed out of range: " << text << std::endl;
            return false;
        }
        return true;
    }

    /**
     * @brief Check value ranges, printing the first problem found
     */
    static bool validate(const RenderConfig& config) {
        const Renderer::Settings& s = config.render;
        if (s.width <= 0 || s.height <= 0) {
            std::cerr << "Error: Image size must be positive, got "
                      << s.width << "x" << s.height << std::endl;
            return false;
        }
        if (s.samples_per_pixel <= 0) {
            std::cerr << "Error: Samples per pixel must be positive" << std::endl;
            return false;
        }
        if (s.max_depth < 1) {
            std::cerr << "Error: Max depth must be at least 1" << std::endl;
            return false;
        }
        if (s.threads < 0) {
            std::cerr << "Error: Thread count cannot be negative" << std::endl;
            return false;
        }
        if (config.output.empty()) {
            std::cerr << "Error: Output path is empty" << std::endl;
            return false;
        }
        return true;
    }
};

} // namespace pathtracer
