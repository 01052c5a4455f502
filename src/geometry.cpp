#include "geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

Bounds Triangle::bounds() const
{
    Bounds bb;
    bb.min_x = std::min({a.x, b.x, c.x});
    bb.min_y = std::min({a.y, b.y, c.y});
    bb.max_x = std::max({a.x, b.x, c.x});
    bb.max_y = std::max({a.y, b.y, c.y});
    return bb;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
Triangle equilateral(double side)
{
    if (!std::isfinite(side) || side <= 0.0) {
        char msg[96];
        std::snprintf(msg, sizeof(msg),
                      "side length must be positive and finite (got %g)", side);
        throw DegenerateGeometryError(msg);
    }
    return Triangle{
        {0.0,        0.0},
        {side,       0.0},
        {side / 2.0, side * std::sqrt(3.0) / 2.0},
    };
}

Triangle from_three_points(Point a, Point b, Point c)
{
    for (const Point& p : {a, b, c}) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y))
            throw DegenerateGeometryError("triangle vertex is not finite");
    }

    // Edges are scaled by their largest component before squaring, so the
    // test depends on neither the triangle's size nor its magnitude.
    const Point  ab    = b - a;
    const Point  ac    = c - a;
    const Point  bc    = c - b;
    const double scale = std::max({std::abs(ab.x), std::abs(ab.y),
                                   std::abs(ac.x), std::abs(ac.y),
                                   std::abs(bc.x), std::abs(bc.y)});
    if (!std::isfinite(scale))
        throw DegenerateGeometryError("triangle vertices are too far apart to represent its edges");

    double l2    = 0.0;
    double area2 = 0.0;
    if (scale > 0.0) {
        const Point u{ab.x / scale, ab.y / scale};
        const Point v{ac.x / scale, ac.y / scale};
        const Point w{bc.x / scale, bc.y / scale};
        l2    = std::max({u.x * u.x + u.y * u.y,
                          v.x * v.x + v.y * v.y,
                          w.x * w.x + w.y * w.y});
        area2 = std::abs(u.x * v.y - v.x * u.y);
    }
    if (l2 == 0.0 || area2 <= 1e-12 * l2) {
        char msg[192];
        std::snprintf(msg, sizeof(msg),
                      "points (%g, %g), (%g, %g), (%g, %g) are collinear",
                      a.x, a.y, b.x, b.y, c.x, c.y);
        throw DegenerateGeometryError(msg);
    }
    return Triangle{a, b, c};
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
std::array<double, 3> barycentric(const Triangle& t, Point p)
{
    const double d  = 2.0 * t.signed_area();
    const double wb = ((p.x - t.a.x) * (t.c.y - t.a.y) - (t.c.x - t.a.x) * (p.y - t.a.y)) / d;
    const double wc = ((t.b.x - t.a.x) * (p.y - t.a.y) - (p.x - t.a.x) * (t.b.y - t.a.y)) / d;
    return {1.0 - wb - wc, wb, wc};
}

bool contains(const Triangle& t, Point p, double tol)
{
    const auto w = barycentric(t, p);
    return w[0] >= -tol && w[1] >= -tol && w[2] >= -tol;
}
