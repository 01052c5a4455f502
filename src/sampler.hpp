#pragma once

#include "geometry.hpp"

#include <cstdint>
#include <random>

// Random source for the chaos game. Owns its generator; every draw advances
// it, so a fixed seed and call order reproduce the same sequence.
class Sampler {
public:
    explicit Sampler(std::uint64_t seed);

    // Seeded from std::random_device.
    static Sampler from_entropy();

    void          reseed(std::uint64_t seed);
    std::uint64_t seed() const { return seed_; }

    // Uniform over the triangle's area (boundary included).
    Point random_interior_point(const Triangle& t);

    // a, b or c with probability 1/3 each.
    Point random_vertex(const Triangle& t);

private:
    // Uniform in [0, hi], hi >= 0.
    double uniform_closed(double hi);

    std::mt19937_64 rng;
    std::uint64_t   seed_;
};
