/**
 * @file pdf.hpp
 * @brief Direction sampling distributions used by the integrator
 *
 * A Pdf pairs a sampler with the density of that same sampler, measured
 * per unit solid angle. The integrator divides by value() of whatever it
 * sampled with, so the two must agree exactly.
 */

#pragma once

extern "C" {
#include "../core/vec3.h"
}

#include "hittable.hpp"
#include "onb.hpp"
#include "random.hpp"
#include <cmath>

namespace pathtracer {

/**
 * @brief Sampling distribution over directions
 */
class Pdf {
public:
    virtual ~Pdf() = default;

    /**
     * @brief Density at a direction (need not be unit length), >= 0
     */
    virtual double value(vec3 direction) const = 0;

    /**
     * @brief Draw a direction from the distribution
     */
    virtual vec3 generate() const = 0;
};

/**
 * @brief Cosine-weighted hemisphere around a normal
 */
class CosinePdf : public Pdf {
public:
    explicit CosinePdf(vec3 normal) : uvw_(ONB::from_w(normal)) {}

    double value(vec3 direction) const override {
        double cosine = vec3_dot(vec3_normalize(direction), uvw_.w);
        return cosine <= 0.0 ? 0.0 : cosine * INV_PI;
    }

    vec3 generate() const override {
        return uvw_.local(random_cosine_direction());
    }

private:
    ONB uvw_;
};

/**
 * @brief Directions toward a shape, as seen from a fixed origin
 *
 * The shape is borrowed and must outlive the pdf.
 */
class HittablePdf : public Pdf {
public:
    HittablePdf(const Hittable& target, point3 origin)
        : target_(target), origin_(origin) {}

    double value(vec3 direction) const override {
        return target_.pdf_value(origin_, direction);
    }

    vec3 generate() const override {
        return target_.random(origin_);
    }

private:
    const Hittable& target_;
    point3 origin_;
};

/**
 * @brief Equal-weight one-sample mixture of two distributions
 *
 * Both children are borrowed and must outlive the mixture.
 */
class MixturePdf : public Pdf {
public:
    MixturePdf(const Pdf& first, const Pdf& second)
        : first_(first), second_(second) {}

    double value(vec3 direction) const override {
        return 0.5 * first_.value(direction) + 0.5 * second_.value(direction);
    }

    vec3 generate() const override {
        if (random_double() < 0.5) {
            return first_.generate();
        }
        return second_.generate();
    }

private:
    const Pdf& first_;
    const Pdf& second_;
};

} // namespace pathtracer
