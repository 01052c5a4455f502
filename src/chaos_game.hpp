#pragma once

#include "geometry.hpp"
#include "pixel_buffer.hpp"
#include "sampler.hpp"

#include <cstdint>
#include <functional>

// Called with (iterations done, iterations total).
using ProgressFn = std::function<void(uint64_t, uint64_t)>;

struct StepResult {
    Point      point;            // current point after the transition
    int64_t    px     = 0;       // pixel_index(point.x)
    int64_t    py     = 0;       // pixel_index(point.y)
    PlotStatus status = PlotStatus::Plotted;
};

struct RunStats {
    uint64_t plotted       = 0;
    uint64_t out_of_bounds = 0;  // writes skipped at the canvas boundary
};

// Chaos game on a triangle: each transition moves the current point halfway
// toward a random vertex and plots the pixel it lands in. The initial point
// is sampled uniformly inside the triangle and is not plotted.
class ChaosGame {
public:
    ChaosGame(const Triangle& triangle, uint64_t iterations, Sampler sampler,
              uint32_t foreground = COLOR_WHITE);

    // One transition. No-op once finished(); the returned point is then the
    // final one and status is Plotted with no write performed.
    StepResult step(PixelBuffer& buf);

    // Runs every remaining transition. progress (if set) is called every
    // progress_interval iterations and once more at the end.
    RunStats run(PixelBuffer& buf, const ProgressFn& progress = {},
                 uint64_t progress_interval = 65536);

    bool            finished()         const { return done == total; }
    uint64_t        iterations_done()  const { return done; }
    uint64_t        iterations_total() const { return total; }
    Point           current_point()    const { return current; }
    const Triangle& triangle()         const { return tri; }
    const RunStats& stats()            const { return counters; }

    double last_render_ms = 0.0;

private:
    Triangle tri;
    Sampler  sampler;
    uint64_t total;
    uint64_t done = 0;
    uint32_t color;
    Point    current;
    RunStats counters;
};
