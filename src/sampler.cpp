#include "sampler.hpp"

#include <cmath>
#include <limits>

Sampler::Sampler(std::uint64_t seed)
    : rng(seed), seed_(seed)
{
}

Sampler Sampler::from_entropy()
{
    std::random_device rd;
    const std::uint64_t seed =
        (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
    return Sampler(seed);
}

void Sampler::reseed(std::uint64_t seed)
{
    rng.seed(seed);
    seed_ = seed;
}

double Sampler::uniform_closed(double hi)
{
    // uniform_real_distribution is half-open; widen by one ulp to include hi.
    const double upper = std::nextafter(hi, std::numeric_limits<double>::max());
    std::uniform_real_distribution<double> dist(0.0, upper);
    const double r = dist(rng);
    return r > hi ? hi : r;
}

// ---------------------------------------------------------------------------
// Barycentric sampling: r1 in [0,1], r2 in [0, 1-r1] keeps (r1, r2) inside
// the simplex u >= 0, v >= 0, u + v <= 1.
// r1 is deliberately NOT uniform on [0,1]: a uniform r1 followed by r2 uniform
// on [0, 1-r1] piles half the samples into the corner at B. Instead r1 is
// drawn from its marginal density 2(1 - r1) (inverse CDF), after which r2
// uniform on [0, 1-r1] makes the pair uniform over the simplex.
// P = A + r1 * (B - A) + r2 * (C - A)
// ---------------------------------------------------------------------------
Point Sampler::random_interior_point(const Triangle& t)
{
    const double r1 = 1.0 - std::sqrt(1.0 - uniform_closed(1.0));
    const double r2 = uniform_closed(1.0 - r1);
    return t.a + (t.b - t.a) * r1 + (t.c - t.a) * r2;
}

Point Sampler::random_vertex(const Triangle& t)
{
    std::uniform_int_distribution<int> dist(0, 2);
    switch (dist(rng)) {
        case 0:  return t.a;
        case 1:  return t.b;
        default: return t.c;
    }
}
