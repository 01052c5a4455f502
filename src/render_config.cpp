#include "render_config.hpp"

#include <algorithm>

std::string validate(const RenderConfig& cfg)
{
    if (cfg.width <= 0 || cfg.height <= 0)
        return "canvas width and height must be positive (got " +
               std::to_string(cfg.width) + "x" + std::to_string(cfg.height) + ")";
    if (cfg.sizing == TriangleSizing::SideLength && !(cfg.side_length > 0.0))
        return "side length must be positive";
    return {};
}

Triangle make_triangle(const RenderConfig& cfg)
{
    switch (cfg.sizing) {
        case TriangleSizing::FitCanvas:
            return equilateral(static_cast<double>(std::min(cfg.width, cfg.height)));
        case TriangleSizing::SideLength:
            return equilateral(cfg.side_length);
        case TriangleSizing::ExplicitPoints:
            return from_three_points(cfg.points[0], cfg.points[1], cfg.points[2]);
    }
    throw DegenerateGeometryError("unknown triangle sizing policy");
}

// The far edge itself counts as inside: only a point sitting exactly on it
// maps out of range, and the canvas rejects that single write.
bool triangle_fits(const Triangle& t, int width, int height)
{
    const Bounds bb = t.bounds();
    return bb.min_x >= 0.0 && bb.min_y >= 0.0 &&
           bb.max_x <= static_cast<double>(width) &&
           bb.max_y <= static_cast<double>(height);
}
