#pragma once

#include <array>
#include <stdexcept>
#include <string>

// Thrown when a triangle would be degenerate (zero area).
class DegenerateGeometryError : public std::invalid_argument {
public:
    explicit DegenerateGeometryError(const std::string& what)
        : std::invalid_argument(what) {}
};

struct Point {
    double x = 0.0;
    double y = 0.0;
};

inline Point operator+(Point p, Point q) { return {p.x + q.x, p.y + q.y}; }
inline Point operator-(Point p, Point q) { return {p.x - q.x, p.y - q.y}; }
inline Point operator*(Point p, double s) { return {p.x * s, p.y * s}; }
inline Point operator*(double s, Point p) { return {p.x * s, p.y * s}; }

inline bool operator==(Point p, Point q) { return p.x == q.x && p.y == q.y; }
inline bool operator!=(Point p, Point q) { return !(p == q); }

// Axis-aligned bounding box, inclusive on both ends.
struct Bounds {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;
};

// Vertices in no particular order. Aggregate construction is unchecked;
// use equilateral() or from_three_points() to reject degenerate input.
struct Triangle {
    Point a;
    Point b;
    Point c;

    std::array<Point, 3> vertices() const { return {a, b, c}; }

    // Positive for counter-clockwise a, b, c.
    double signed_area() const
    {
        return 0.5 * ((b.x - a.x) * (c.y - a.y) - (c.x - a.x) * (b.y - a.y));
    }

    Bounds bounds() const;
};

inline bool operator==(const Triangle& l, const Triangle& r)
{
    return l.a == r.a && l.b == r.b && l.c == r.c;
}

// (0,0), (side,0), (side/2, side*sqrt(3)/2). side must be finite and > 0.
Triangle equilateral(double side);

// Rejects collinear (or non-finite) points.
Triangle from_three_points(Point a, Point b, Point c);

// Barycentric weights of p relative to t: p = wa*a + wb*b + wc*c.
// Requires a non-degenerate triangle.
std::array<double, 3> barycentric(const Triangle& t, Point p);

// True when p lies inside t or on its boundary, within tol on each weight.
bool contains(const Triangle& t, Point p, double tol = 1e-9);
