#pragma once

#include "geometry.hpp"
#include "pixel_buffer.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

enum class TriangleSizing {
    FitCanvas      = 0,  // equilateral, side = min(width, height), anchored at (0,0)
    SideLength     = 1,  // equilateral with an explicit side
    ExplicitPoints = 2,  // three caller-supplied vertices
};

enum class ImageFormat {
    Png = 0,
    Jxl = 1,
};

struct RenderConfig {
    int                     width            = 0;
    int                     height           = 0;
    uint64_t                iterations       = 4000000;
    TriangleSizing          sizing           = TriangleSizing::FitCanvas;
    double                  side_length      = 0.0;
    std::array<Point, 3>    points           = {};
    std::optional<uint64_t> seed;                       // nullopt: seed from entropy
    uint32_t                foreground       = COLOR_WHITE;
    uint32_t                background       = COLOR_BLACK;
    ImageFormat             format           = ImageFormat::Png;
    std::string             output_directory = "./";
};

inline const char* format_extension(ImageFormat f)
{
    return f == ImageFormat::Jxl ? "jxl" : "png";
}

// Returns empty string when cfg is usable, or an error message.
std::string validate(const RenderConfig& cfg);

// Builds the triangle for cfg's sizing policy.
// Throws DegenerateGeometryError.
Triangle make_triangle(const RenderConfig& cfg);

// True when t's bounding box lies within [0,width] x [0,height].
bool triangle_fits(const Triangle& t, int width, int height);
