/**
 * @file scenes.hpp
 * @brief Built-in scenes selectable by name
 */

#pragma once

#include "camera.hpp"
#include "scene.hpp"
#include <string>
#include <vector>

namespace pathtracer {

/**
 * @brief A ready-to-render scene with its camera
 */
struct SceneData {
    Scene scene;
    Camera camera;
};

/**
 * @brief Build a named scene
 * @param name One of scene_names()
 * @param aspect_ratio Image width / height, passed to the camera
 * @param out Populated on success, untouched otherwise
 * @return false if the name is unknown
 */
bool make_scene(const std::string& name, double aspect_ratio, SceneData& out);

/**
 * @brief Names accepted by make_scene, in listing order
 */
std::vector<std::string> scene_names();

/**
 * @brief One-line description of a named scene (empty if unknown)
 */
std::string scene_description(const std::string& name);

} // namespace pathtracer
