#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

static constexpr uint32_t COLOR_BLACK = 0xFF000000u;
static constexpr uint32_t COLOR_WHITE = 0xFFFFFFFFu;

// Packs 8-bit channels into the buffer's 0xAABBGGRR layout.
inline constexpr uint32_t rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF)
{
    return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(b) << 16) |
           (static_cast<uint32_t>(g) << 8)  |  static_cast<uint32_t>(r);
}

// floor(v) as a pixel index. Values beyond the int64_t range (and NaN)
// saturate, so they still land outside any canvas instead of overflowing.
inline int64_t pixel_index(double v)
{
    const double f = std::floor(v);
    if (f < -9223372036854775808.0)
        return std::numeric_limits<int64_t>::min();
    if (!(f < 9223372036854775808.0))
        return std::numeric_limits<int64_t>::max();
    return static_cast<int64_t>(f);
}

enum class PlotStatus {
    Plotted,
    OutOfBounds,   // write rejected, buffer unchanged
};

// Pixel buffer: RGBA, little-endian packed as 0xAABBGGRR
struct PixelBuffer {
    std::vector<uint32_t> pixels;
    int width  = 0;
    int height = 0;

    void resize(int w, int h, uint32_t background = COLOR_BLACK)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), background);
    }

    bool in_bounds(int64_t x, int64_t y) const
    {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    uint32_t at(int x, int y) const
    {
        return pixels[static_cast<size_t>(y) * width + x];
    }

    PlotStatus plot(int64_t x, int64_t y, uint32_t color)
    {
        if (!in_bounds(x, y))
            return PlotStatus::OutOfBounds;
        pixels[static_cast<size_t>(y) * width + static_cast<size_t>(x)] = color;
        return PlotStatus::Plotted;
    }
};
