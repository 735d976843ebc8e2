/**
 * @file geometry_test.cpp
 * @brief Tests for shapes and instancing wrappers
 *
 * Verifies:
 * - Sphere hit points and normals
 * - Ray interval handling
 * - Axis-aligned rectangles and their axis ordering
 * - Box face orientation
 * - FlipNormals, Rotate and Translate
 */

#include "hittable.hpp"
#include "primitives.hpp"
#include "random.hpp"
#include "sphere.hpp"
#include "transform.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>

using namespace pathtracer;

constexpr double EPSILON = 1e-9;
constexpr double INF = std::numeric_limits<double>::infinity();

bool approx_equal(double a, double b, double eps = EPSILON) {
    return std::abs(a - b) < eps;
}

bool approx_equal(vec3 a, vec3 b, double eps = EPSILON) {
    return approx_equal(a.x, b.x, eps) && approx_equal(a.y, b.y, eps) && approx_equal(a.z, b.z, eps);
}

void test_sphere_surface() {
    std::cout << "Testing sphere hit points...\n";

    seed_random(11);
    point3 center = {1.0, -2.0, 3.0};
    double radius = 1.5;
    Sphere sphere(center, radius, 4);

    int hits = 0;
    for (int i = 0; i < 2000; ++i) {
        point3 origin = vec3_add(center, vec3_scale(random_unit_vector(), 10.0));
        // Aim somewhere inside the sphere so every ray hits
        point3 target = vec3_add(center, vec3_scale(random_in_unit_sphere(), radius * 0.9));
        ray r = ray_create(origin, vec3_sub(target, origin));

        hit_record rec = hit_record_init();
        assert(sphere.hit(r, RAY_EPSILON, INF, rec));
        ++hits;

        assert(approx_equal(vec3_length(vec3_sub(rec.point, center)), radius, 1e-7));
        assert(approx_equal(vec3_length(rec.normal), 1.0, 1e-7));
        vec3 expected = vec3_scale(vec3_sub(rec.point, center), 1.0 / radius);
        assert(approx_equal(rec.normal, expected, 1e-7));
        assert(rec.front_face);
        assert(rec.material_id == 4);
        assert(rec.u >= 0.0 && rec.u <= 1.0);
        assert(rec.v >= 0.0 && rec.v <= 1.0);
    }
    assert(hits == 2000);

    std::cout << "  PASSED\n";
}

void test_sphere_interval() {
    std::cout << "Testing sphere ray interval...\n";

    Sphere sphere({0.0, 0.0, 0.0}, 1.0);
    ray r = ray_create({0.0, 0.0, -5.0}, {0.0, 0.0, 1.0});
    hit_record rec = hit_record_init();

    assert(sphere.hit(r, RAY_EPSILON, INF, rec));
    assert(approx_equal(rec.t, 4.0));
    assert(rec.front_face);

    // Both roots past t_max
    assert(!sphere.hit(r, RAY_EPSILON, 3.0, rec));

    // Near root excluded, far root taken; the hit is from inside
    assert(sphere.hit(r, 4.5, INF, rec));
    assert(approx_equal(rec.t, 6.0));
    assert(!rec.front_face);
    assert(approx_equal(rec.normal, {0.0, 0.0, 1.0}));

    // Pointing away
    ray away = ray_create({0.0, 0.0, -5.0}, {0.0, 0.0, -1.0});
    assert(!sphere.hit(away, RAY_EPSILON, INF, rec));

    std::cout << "  PASSED\n";
}

void test_rect_hit() {
    std::cout << "Testing axis-aligned rectangle...\n";

    AARect rect(Plane::XY, -1.0, 1.0, -2.0, 2.0, 2.0, 1);
    assert(approx_equal(rect.area(), 8.0));

    hit_record rec = hit_record_init();
    ray r = ray_create({0.0, 1.0, 0.0}, {0.0, 0.0, 1.0});
    assert(rect.hit(r, RAY_EPSILON, INF, rec));
    assert(approx_equal(rec.t, 2.0));
    assert(approx_equal(rec.point, {0.0, 1.0, 2.0}));
    assert(approx_equal(rec.normal, {0.0, 0.0, 1.0}));
    assert(!rec.front_face);
    assert(approx_equal(rec.u, 0.5));
    assert(approx_equal(rec.v, 0.75));

    // Parallel to the plane
    ray parallel = ray_create({0.0, 0.0, 2.0}, {1.0, 0.0, 0.0});
    assert(!rect.hit(parallel, RAY_EPSILON, INF, rec));

    // Outside the bounds
    ray outside = ray_create({1.5, 0.0, 0.0}, {0.0, 0.0, 1.0});
    assert(!rect.hit(outside, RAY_EPSILON, INF, rec));

    // Beyond t_max
    assert(!rect.hit(r, RAY_EPSILON, 1.0, rec));

    std::cout << "  PASSED\n";
}

void test_rect_axis_order() {
    std::cout << "Testing rectangle axis order...\n";

    // ZX takes the z range first, then the x range
    AARect light(Plane::ZX, 227.0, 332.0, 213.0, 343.0, 554.0);
    hit_record rec = hit_record_init();
    vec3 up = {0.0, 1.0, 0.0};

    assert(light.hit(ray_create({300.0, 0.0, 250.0}, up), RAY_EPSILON, INF, rec));
    assert(approx_equal(rec.point.y, 554.0));
    assert(approx_equal(rec.normal, {0.0, 1.0, 0.0}));

    // x = 220 is inside [213, 343] but would be outside [227, 332]
    assert(light.hit(ray_create({220.0, 0.0, 300.0}, up), RAY_EPSILON, INF, rec));
    // z = 340 is outside [227, 332]
    assert(!light.hit(ray_create({230.0, 0.0, 340.0}, up), RAY_EPSILON, INF, rec));

    AARect wall(Plane::YZ, 0.0, 10.0, 20.0, 30.0, 5.0);
    assert(wall.hit(ray_create({0.0, 5.0, 25.0}, {1.0, 0.0, 0.0}), RAY_EPSILON, INF, rec));
    assert(approx_equal(rec.normal, {1.0, 0.0, 0.0}));
    assert(!wall.hit(ray_create({0.0, 25.0, 5.0}, {1.0, 0.0, 0.0}), RAY_EPSILON, INF, rec));

    std::cout << "  PASSED\n";
}

void test_box_faces_outward() {
    std::cout << "Testing box face orientation...\n";

    Box box({0.0, 0.0, 0.0}, {1.0, 2.0, 3.0});
    point3 c = {0.5, 1.0, 1.5};
    vec3 axes[3] = {{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}};

    for (const vec3& axis : axes) {
        for (double sign : {1.0, -1.0}) {
            vec3 dir = vec3_scale(axis, sign);
            point3 origin = vec3_add(c, vec3_scale(dir, 10.0));
            hit_record rec = hit_record_init();
            assert(box.hit(ray_create(origin, vec3_negate(dir)), RAY_EPSILON, INF, rec));
            assert(approx_equal(rec.normal, dir));
            assert(rec.front_face);
        }
    }

    std::cout << "  PASSED\n";
}

void test_closest_hit() {
    std::cout << "Testing closest hit in a list...\n";

    HittableList list;
    assert(list.empty());
    list.add(std::make_shared<Sphere>(point3{0.0, 0.0, 10.0}, 1.0, 1));
    list.add(std::make_shared<Sphere>(point3{0.0, 0.0, 5.0}, 1.0, 2));
    list.add(std::make_shared<Sphere>(point3{0.0, 0.0, 20.0}, 1.0, 3));
    assert(list.size() == 3);

    hit_record rec = hit_record_init();
    assert(list.hit(ray_create({0.0, 0.0, 0.0}, {0.0, 0.0, 1.0}), RAY_EPSILON, INF, rec));
    assert(rec.material_id == 2);
    assert(approx_equal(rec.t, 4.0));

    // A tighter t_max hides everything
    assert(!list.hit(ray_create({0.0, 0.0, 0.0}, {0.0, 0.0, 1.0}), RAY_EPSILON, 3.0, rec));

    std::cout << "  PASSED\n";
}

void test_flip_normals() {
    std::cout << "Testing FlipNormals...\n";

    auto rect = std::make_shared<AARect>(Plane::ZX, -1.0, 1.0, -1.0, 1.0, 3.0, 7);
    FlipNormals flipped(rect);

    ray r = ray_create({0.2, 0.0, -0.3}, {0.0, 1.0, 0.0});
    hit_record plain = hit_record_init();
    hit_record flip = hit_record_init();
    assert(rect->hit(r, RAY_EPSILON, INF, plain));
    assert(flipped.hit(r, RAY_EPSILON, INF, flip));

    assert(approx_equal(flip.t, plain.t));
    assert(approx_equal(flip.point, plain.point));
    assert(approx_equal(flip.u, plain.u));
    assert(approx_equal(flip.v, plain.v));
    assert(flip.material_id == plain.material_id);
    assert(approx_equal(flip.normal, vec3_negate(plain.normal)));
    assert(flip.front_face == !plain.front_face);
    assert(flip.front_face);

    // Sampling passes straight through
    point3 origin = {0.0, 0.0, 0.0};
    vec3 dir = {0.1, 1.0, 0.2};
    assert(approx_equal(flipped.pdf_value(origin, dir), rect->pdf_value(origin, dir)));

    std::cout << "  PASSED\n";
}

void test_rotate_identity() {
    std::cout << "Testing Rotate by 0 and 360 degrees...\n";

    auto box = std::make_shared<Box>(point3{-1.0, -1.0, -1.0}, point3{1.0, 2.0, 1.5});
    Rotate zero(box, Axis::Y, 0.0);
    Rotate full(box, Axis::Y, 360.0);
    Rotate full_x(box, Axis::X, 360.0);

    seed_random(23);
    for (int i = 0; i < 1000; ++i) {
        point3 origin = vec3_scale(random_unit_vector(), 8.0);
        vec3 dir = vec3_sub(vec3_scale(random_in_unit_sphere(), 2.5), origin);
        ray r = ray_create(origin, dir);

        hit_record expected = hit_record_init();
        bool expected_hit = box->hit(r, RAY_EPSILON, INF, expected);

        const Rotate* rotations[] = {&zero, &full, &full_x};
        for (const Rotate* rot : rotations) {
            hit_record rec = hit_record_init();
            bool got = rot->hit(r, RAY_EPSILON, INF, rec);
            assert(got == expected_hit);
            if (got) {
                assert(approx_equal(rec.t, expected.t, 1e-7));
                assert(approx_equal(rec.point, expected.point, 1e-7));
                assert(approx_equal(rec.normal, expected.normal, 1e-7));
                assert(rec.front_face == expected.front_face);
            }
        }
    }

    std::cout << "  PASSED\n";
}

void test_translate_rotate() {
    std::cout << "Testing Translate(Rotate(box))...\n";

    // Unit cube turned 90 degrees about Y maps (x, y, z) -> (z, y, -x),
    // then moved by +10 in x: occupies x in [10, 11], z in [-1, 0]
    auto cube = std::make_shared<Box>(point3{0.0, 0.0, 0.0}, point3{1.0, 1.0, 1.0});
    Translate placed(std::make_shared<Rotate>(cube, Axis::Y, 90.0), {10.0, 0.0, 0.0});

    hit_record rec = hit_record_init();
    assert(placed.hit(ray_create({10.5, 0.5, 5.0}, {0.0, 0.0, -1.0}), RAY_EPSILON, INF, rec));
    assert(approx_equal(rec.t, 5.0, 1e-7));
    assert(approx_equal(rec.point, {10.5, 0.5, 0.0}, 1e-7));
    assert(approx_equal(rec.normal, {0.0, 0.0, 1.0}, 1e-7));
    assert(rec.front_face);

    assert(placed.hit(ray_create({20.0, 0.5, -0.5}, {-1.0, 0.0, 0.0}), RAY_EPSILON, INF, rec));
    assert(approx_equal(rec.t, 9.0, 1e-7));
    assert(approx_equal(rec.normal, {1.0, 0.0, 0.0}, 1e-7));

    // Where the untransformed cube would be
    assert(!placed.hit(ray_create({0.5, 0.5, 5.0}, {0.0, 0.0, -1.0}), RAY_EPSILON, INF, rec));

    // 90 degrees about Z maps (x, y, z) -> (-y, x, z): x in [-1, 0], y in [0, 1]
    Rotate about_z(cube, Axis::Z, 90.0);
    assert(about_z.hit(ray_create({-0.5, 5.0, 0.5}, {0.0, -1.0, 0.0}), RAY_EPSILON, INF, rec));
    assert(approx_equal(rec.t, 4.0, 1e-7));
    assert(approx_equal(rec.normal, {0.0, 1.0, 0.0}, 1e-7));
    assert(!about_z.hit(ray_create({0.5, 5.0, 0.5}, {0.0, -1.0, 0.0}), RAY_EPSILON, INF, rec));

    std::cout << "  PASSED\n";
}

void test_translate_keeps_time() {
    std::cout << "Testing Translate keeps ray time...\n";

    class TimeRecorder : public Hittable {
    public:
        mutable double seen_time = -1.0;
        bool hit(ray r, double, double, hit_record&) const override {
            seen_time = r.time;
            return false;
        }
    };

    auto recorder = std::make_shared<TimeRecorder>();
    Translate moved(std::make_shared<Rotate>(recorder, Axis::X, 30.0), {1.0, 2.0, 3.0});
    hit_record rec = hit_record_init();
    assert(!moved.hit(ray_create_timed({0.0, 0.0, 0.0}, {0.0, 0.0, 1.0}, 0.75), RAY_EPSILON, INF, rec));
    assert(approx_equal(recorder->seen_time, 0.75));

    std::cout << "  PASSED\n";
}

int main() {
    std::cout << "=== Geometry Tests ===\n\n";

    test_sphere_surface();
    test_sphere_interval();
    test_rect_hit();
    test_rect_axis_order();
    test_box_faces_outward();
    test_closest_hit();
    test_flip_normals();
    test_rotate_identity();
    test_translate_rotate();
    test_translate_keeps_time();

    std::cout << "\n=== All tests PASSED ===\n";
    return 0;
}
