/**
 * @file material_test.cpp
 * @brief Tests for material scattering and emission
 *
 * Verifies:
 * - Lambertian scatter and density
 * - Metal reflection and fuzz clamping
 * - Dielectric refraction, total internal reflection, matched index
 * - One-sided emission
 * - Textures
 */

#include "material.hpp"
#include "random.hpp"
#include "texture.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace pathtracer;

constexpr double EPSILON = 1e-9;

bool approx_equal(double a, double b, double eps = EPSILON) {
    return std::abs(a - b) < eps;
}

bool approx_equal(vec3 a, vec3 b, double eps = EPSILON) {
    return approx_equal(a.x, b.x, eps) && approx_equal(a.y, b.y, eps) && approx_equal(a.z, b.z, eps);
}

/**
 * @brief Hit at the origin on a surface with the given outward normal
 */
hit_record surface_hit(ray r, vec3 outward_normal) {
    hit_record rec = hit_record_init();
    rec.point = {0.0, 0.0, 0.0};
    rec.t = 1.0;
    rec.material_id = 0;
    hit_record_set_normal(&rec, r, outward_normal);
    return rec;
}

void test_lambertian() {
    std::cout << "Testing Lambertian scatter...\n";

    seed_random(1);
    Material mat = Material::lambertian({0.2, 0.4, 0.6});
    vec3 n = {0.0, 1.0, 0.0};
    ray r = ray_create_timed({0.0, 1.0, -1.0}, {0.0, -1.0, 1.0}, 0.3);
    hit_record rec = surface_hit(r, n);

    ScatterRecord srec;
    assert(mat.scatter(r, rec, srec));
    assert(!srec.is_specular);
    assert(srec.pdf != nullptr);
    assert(approx_equal(srec.attenuation, {0.2, 0.4, 0.6}));

    for (int i = 0; i < 1000; ++i) {
        vec3 d = srec.pdf->generate();
        assert(vec3_dot(d, n) >= -1e-12);
    }

    // cos/pi above, zero below
    ray up = ray_create({0.0, 0.0, 0.0}, {0.0, 2.0, 0.0});
    ray slanted = ray_create({0.0, 0.0, 0.0}, {1.0, 1.0, 0.0});
    ray down = ray_create({0.0, 0.0, 0.0}, {0.0, -1.0, 0.0});
    assert(approx_equal(mat.scattering_pdf(r, rec, up), INV_PI));
    assert(approx_equal(mat.scattering_pdf(r, rec, slanted), std::sqrt(0.5) * INV_PI));
    assert(mat.scattering_pdf(r, rec, down) == 0.0);

    // Diffuse surfaces do not glow
    assert(approx_equal(mat.emitted(r, rec), {0.0, 0.0, 0.0}));

    std::cout << "  PASSED\n";
}

void test_metal() {
    std::cout << "Testing metal reflection...\n";

    Material mirror = Material::metal({0.8, 0.85, 0.88}, 0.0);
    vec3 n = {0.0, 1.0, 0.0};
    ray r = ray_create_timed({-1.0, 1.0, 0.0}, {1.0, -1.0, 0.0}, 0.6);
    hit_record rec = surface_hit(r, n);

    ScatterRecord srec;
    assert(mirror.scatter(r, rec, srec));
    assert(srec.is_specular);
    assert(srec.pdf == nullptr);
    assert(approx_equal(srec.attenuation, {0.8, 0.85, 0.88}));
    assert(approx_equal(vec3_normalize(srec.specular_ray.direction),
                        vec3_normalize({1.0, 1.0, 0.0})));
    assert(approx_equal(srec.specular_ray.time, 0.6));
    assert(mirror.scattering_pdf(r, rec, srec.specular_ray) == 0.0);

    // Fuzz is clamped to [0, 1]
    assert(Material::metal({1.0, 1.0, 1.0}, 5.0).fuzz == 1.0);
    assert(Material::metal({1.0, 1.0, 1.0}, -2.0).fuzz == 0.0);
    assert(Material::metal({1.0, 1.0, 1.0}, 0.3).fuzz == 0.3);

    // Fuzzy reflections below the surface are absorbed
    seed_random(2);
    Material rough = Material::metal({1.0, 1.0, 1.0}, 1.0);
    ray grazing = ray_create({-1.0, 0.01, 0.0}, {1.0, -0.01, 0.0});
    hit_record grazing_rec = surface_hit(grazing, n);
    int absorbed = 0;
    for (int i = 0; i < 1000; ++i) {
        ScatterRecord s;
        bool scattered = rough.scatter(grazing, grazing_rec, s);
        if (scattered) {
            assert(vec3_dot(s.specular_ray.direction, n) > 0.0);
        } else {
            ++absorbed;
        }
    }
    assert(absorbed > 0);

    std::cout << "  PASSED\n";
}

void test_dielectric_matched_index() {
    std::cout << "Testing dielectric with index 1...\n";

    seed_random(3);
    Material glass = Material::dielectric(1.0);
    vec3 n = {0.0, 0.0, 1.0};

    for (int i = 0; i < 2000; ++i) {
        vec3 dir = random_unit_vector();
        if (std::abs(dir.z) < 1e-3) {
            continue;
        }
        ray r = ray_create({0.0, 0.0, 0.0}, dir);
        // Covers both entering (front face) and leaving (back face)
        hit_record rec = surface_hit(r, n);
        assert(rec.front_face == (dir.z < 0.0));

        ScatterRecord srec;
        assert(glass.scatter(r, rec, srec));
        assert(srec.is_specular);
        assert(approx_equal(srec.attenuation, {1.0, 1.0, 1.0}));

        // Straight through, never reflected
        vec3 out = vec3_normalize(srec.specular_ray.direction);
        assert(approx_equal(vec3_dot(out, dir), 1.0, 1e-9));
    }

    assert(Material::reflectance(0.3, 1.0) == 0.0);

    std::cout << "  PASSED\n";
}

void test_dielectric_glass() {
    std::cout << "Testing dielectric refraction...\n";

    seed_random(4);
    Material glass = Material::dielectric(1.5);
    vec3 n = {0.0, 1.0, 0.0};

    // Entering at normal incidence: mostly transmitted, 4% reflected
    assert(approx_equal(Material::reflectance(1.0, 1.5), 0.04));
    ray straight = ray_create({0.0, 1.0, 0.0}, {0.0, -1.0, 0.0});
    hit_record rec = surface_hit(straight, n);
    int transmitted = 0;
    for (int i = 0; i < 2000; ++i) {
        ScatterRecord srec;
        assert(glass.scatter(straight, rec, srec));
        vec3 out = vec3_normalize(srec.specular_ray.direction);
        if (out.y < 0.0) {
            assert(approx_equal(out, {0.0, -1.0, 0.0}, 1e-9));
            ++transmitted;
        } else {
            assert(approx_equal(out, {0.0, 1.0, 0.0}, 1e-9));
        }
    }
    assert(transmitted > 1800 && transmitted < 2000);

    // Snell's law on the way in at 45 degrees
    ray oblique = ray_create({-1.0, 1.0, 0.0}, {1.0, -1.0, 0.0});
    rec = surface_hit(oblique, n);
    bool saw_refraction = false;
    for (int i = 0; i < 100 && !saw_refraction; ++i) {
        ScatterRecord srec;
        assert(glass.scatter(oblique, rec, srec));
        vec3 out = vec3_normalize(srec.specular_ray.direction);
        if (out.y < 0.0) {
            double sin_out = std::sqrt(out.x * out.x + out.z * out.z);
            assert(approx_equal(sin_out, std::sqrt(0.5) / 1.5, 1e-9));
            saw_refraction = true;
        }
    }
    assert(saw_refraction);

    // Leaving at a grazing angle: total internal reflection every time
    ray inside = ray_create({-1.0, -0.2, 0.0}, {1.0, 0.2, 0.0});
    rec = surface_hit(inside, n);
    assert(!rec.front_face);
    for (int i = 0; i < 200; ++i) {
        ScatterRecord srec;
        assert(glass.scatter(inside, rec, srec));
        vec3 out = srec.specular_ray.direction;
        assert(out.y < 0.0);
    }

    std::cout << "  PASSED\n";
}

void test_dielectric_reflect_probability() {
    std::cout << "Testing dielectric reflection probability...\n";

    // Entering uses the incident cosine
    assert(approx_equal(Material::reflect_probability(0.85, true, 1.5),
                        Material::reflectance(0.85, 1.5)));
    assert(approx_equal(Material::reflect_probability(1.0, true, 1.5), 0.04));

    // Leaving scales the cosine by the index before Schlick
    double leaving = Material::reflect_probability(0.85, false, 1.5);
    assert(approx_equal(leaving, Material::reflectance(1.5 * 0.85, 1.5)));
    assert(approx_equal(leaving, 0.04 + 0.96 * std::pow(1.0 - 1.275, 5.0)));
    assert(leaving < Material::reflectance(0.85, 1.5));
    assert(leaving > 0.0);

    // Past the critical angle (cos < sqrt(1 - 1/1.5^2)) nothing refracts
    assert(Material::reflect_probability(0.7, false, 1.5) == 1.0);
    assert(Material::reflect_probability(0.7, true, 1.5) < 1.0);

    // No interface
    assert(Material::reflect_probability(0.3, true, 1.0) == 0.0);
    assert(Material::reflect_probability(0.3, false, 1.0) == 0.0);

    std::cout << "  PASSED\n";
}

void test_emission() {
    std::cout << "Testing one-sided emission...\n";

    Material light = Material::diffuse_light({15.0, 15.0, 15.0});
    assert(light.is_emissive());
    assert(!Material::lambertian({1.0, 1.0, 1.0}).is_emissive());

    // Ceiling light facing down
    vec3 n = {0.0, -1.0, 0.0};
    ray from_below = ray_create({0.0, -1.0, 0.0}, {0.0, 1.0, 0.0});
    ray from_above = ray_create({0.0, 1.0, 0.0}, {0.0, -1.0, 0.0});

    hit_record front = surface_hit(from_below, n);
    assert(approx_equal(light.emitted(from_below, front), {15.0, 15.0, 15.0}));

    hit_record back = surface_hit(from_above, n);
    assert(approx_equal(light.emitted(from_above, back), {0.0, 0.0, 0.0}));

    // Lights absorb
    ScatterRecord srec;
    assert(!light.scatter(from_below, front, srec));
    assert(light.scattering_pdf(from_below, front, from_above) == 0.0);

    std::cout << "  PASSED\n";
}

void test_textures() {
    std::cout << "Testing textures...\n";

    Texture solid = Texture::solid({0.1, 0.2, 0.3});
    assert(approx_equal(solid.sample({5.0, -3.0, 2.0}), {0.1, 0.2, 0.3}));

    Texture checker = Texture::checker({1.0, 1.0, 1.0}, {0.0, 0.0, 0.0}, 1.0);
    assert(approx_equal(checker.sample({0.5, 0.5, 0.5}), {1.0, 1.0, 1.0}));
    assert(approx_equal(checker.sample({1.5, 0.5, 0.5}), {0.0, 0.0, 0.0}));
    assert(approx_equal(checker.sample({1.5, 1.5, 0.5}), {1.0, 1.0, 1.0}));
    assert(approx_equal(checker.sample({-0.5, 0.5, 0.5}), {0.0, 0.0, 0.0}));

    // Textured Lambertian picks its albedo from the hit point
    Material floor = Material::lambertian_textured(checker);
    ray r = ray_create({1.5, 1.0, 0.5}, {0.0, -1.0, 0.0});
    hit_record rec = surface_hit(r, {0.0, 1.0, 0.0});
    rec.point = {1.5, 0.0, 0.5};
    ScatterRecord srec;
    assert(floor.scatter(r, rec, srec));
    assert(approx_equal(srec.attenuation, {0.0, 0.0, 0.0}));

    std::cout << "  PASSED\n";
}

int main() {
    std::cout << "=== Material Tests ===\n\n";

    test_lambertian();
    test_metal();
    test_dielectric_matched_index();
    test_dielectric_glass();
    test_dielectric_reflect_probability();
    test_emission();
    test_textures();

    std::cout << "\n=== All tests PASSED ===\n";
    return 0;
}
