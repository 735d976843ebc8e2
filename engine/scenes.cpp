/**
 * @file scenes.cpp
 * @brief Cornell box variants and a small open test scene
 */

#include "scenes.hpp"
#include "material.hpp"
#include "primitives.hpp"
#include "sphere.hpp"
#include "transform.hpp"
#include <memory>
#include <utility>

namespace pathtracer {

namespace {

constexpr double BOX_SIZE = 555.0;

struct CornellMaterials {
    int red;
    int white;
    int green;
};

CornellMaterials add_cornell_materials(Scene& scene) {
    CornellMaterials m;
    m.red = scene.add_material(Material::lambertian({0.65, 0.05, 0.05}));
    m.white = scene.add_material(Material::lambertian({0.73, 0.73, 0.73}));
    m.green = scene.add_material(Material::lambertian({0.12, 0.45, 0.15}));
    return m;
}

// Five walls, every normal facing into the box
void add_cornell_walls(Scene& scene, const CornellMaterials& m) {
    const double s = BOX_SIZE;
    scene.add(std::make_shared<FlipNormals>(
        std::make_shared<AARect>(Plane::YZ, 0, s, 0, s, s, m.green)));
    scene.add(std::make_shared<AARect>(Plane::YZ, 0, s, 0, s, 0, m.red));
    scene.add(std::make_shared<FlipNormals>(
        std::make_shared<AARect>(Plane::ZX, 0, s, 0, s, s, m.white)));
    scene.add(std::make_shared<AARect>(Plane::ZX, 0, s, 0, s, 0, m.white));
    scene.add(std::make_shared<FlipNormals>(
        std::make_shared<AARect>(Plane::XY, 0, s, 0, s, s, m.white)));
}

// Downward-facing ceiling light; z in [227, 332], x in [213, 343]
void add_cornell_light(Scene& scene) {
    int light = scene.add_material(Material::diffuse_light({15.0, 15.0, 15.0}));
    auto rect = std::make_shared<FlipNormals>(
        std::make_shared<AARect>(Plane::ZX, 227, 332, 213, 343, BOX_SIZE - 1.0, light));
    scene.add(rect);
    scene.add_light(rect);
}

std::shared_ptr<Hittable> placed_box(point3 size, double y_degrees, vec3 offset, int mat_id) {
    auto box = std::make_shared<Box>(vec3_zero(), size, mat_id);
    auto rotated = std::make_shared<Rotate>(box, Axis::Y, y_degrees);
    return std::make_shared<Translate>(rotated, offset);
}

Camera cornell_camera(double aspect_ratio) {
    return Camera({278, 278, -800}, {278, 278, 0}, {0, 1, 0}, 40.0, aspect_ratio,
                  0.0, 10.0, 0.0, 1.0);
}

// Glass ball and a tall aluminium block; the ball is also a sampling target
void build_cornell(double aspect_ratio, SceneData& out) {
    Scene& scene = out.scene;
    CornellMaterials m = add_cornell_materials(scene);
    add_cornell_walls(scene, m);
    add_cornell_light(scene);

    int aluminium = scene.add_material(Material::metal({0.8, 0.85, 0.88}, 0.0));
    int glass = scene.add_material(Material::dielectric(1.5));

    auto ball = std::make_shared<Sphere>(point3{190, 90, 190}, 90.0, glass);
    scene.add(ball);
    scene.add_light(ball);

    scene.add(placed_box({165, 330, 165}, 15.0, {265, 0, 295}, aluminium));

    out.camera = cornell_camera(aspect_ratio);
}

void build_cornell_boxes(double aspect_ratio, SceneData& out) {
    Scene& scene = out.scene;
    CornellMaterials m = add_cornell_materials(scene);
    add_cornell_walls(scene, m);
    add_cornell_light(scene);

    scene.add(placed_box({165, 165, 165}, -18.0, {130, 0, 65}, m.white));
    scene.add(placed_box({165, 330, 165}, 15.0, {265, 0, 295}, m.white));

    out.camera = cornell_camera(aspect_ratio);
}

void build_lit_sphere(double aspect_ratio, SceneData& out) {
    Scene& scene = out.scene;

    int floor = scene.add_material(Material::lambertian_textured(
        Texture::checker({0.2, 0.3, 0.1}, {0.9, 0.9, 0.9}, 1.0)));
    int ball = scene.add_material(Material::lambertian({0.7, 0.3, 0.3}));
    int light = scene.add_material(Material::diffuse_light({8.0, 8.0, 8.0}));

    scene.add(std::make_shared<AARect>(Plane::ZX, -20, 20, -20, 20, 0, floor));
    scene.add(std::make_shared<Sphere>(point3{0, 1, 0}, 1.0, ball));

    auto lamp = std::make_shared<FlipNormals>(
        std::make_shared<AARect>(Plane::ZX, -1, 1, -1, 1, 4, light));
    scene.add(lamp);
    scene.add_light(lamp);

    out.camera = Camera({0, 2, -7}, {0, 1, 0}, {0, 1, 0}, 35.0, aspect_ratio);
}

// Cornell geometry without any emitter
void build_dark_box(double aspect_ratio, SceneData& out) {
    Scene& scene = out.scene;
    CornellMaterials m = add_cornell_materials(scene);
    add_cornell_walls(scene, m);

    int glass = scene.add_material(Material::dielectric(1.5));
    scene.add(std::make_shared<Sphere>(point3{190, 90, 190}, 90.0, glass));
    scene.add(placed_box({165, 330, 165}, 15.0, {265, 0, 295}, m.white));

    out.camera = cornell_camera(aspect_ratio);
}

struct SceneEntry {
    const char* name;
    const char* description;
    void (*build)(double, SceneData&);
};

const SceneEntry SCENES[] = {
    {"cornell", "Cornell box with a glass sphere and an aluminium block", build_cornell},
    {"cornell_boxes", "Cornell box with two white blocks", build_cornell_boxes},
    {"lit_sphere", "Diffuse sphere on a checker floor under one area light", build_lit_sphere},
    {"dark_box", "Cornell box with no light (renders black)", build_dark_box},
};

} // namespace

bool make_scene(const std::string& name, double aspect_ratio, SceneData& out) {
    for (const SceneEntry& entry : SCENES) {
        if (name == entry.name) {
            SceneData data;
            entry.build(aspect_ratio, data);
            out = std::move(data);
            return true;
        }
    }
    return false;
}

std::vector<std::string> scene_names() {
    std::vector<std::string> names;
    for (const SceneEntry& entry : SCENES) {
        names.emplace_back(entry.name);
    }
    return names;
}

std::string scene_description(const std::string& name) {
    for (const SceneEntry& entry : SCENES) {
        if (name == entry.name) {
            return entry.description;
        }
    }
    return "";
}

} // namespace pathtracer
