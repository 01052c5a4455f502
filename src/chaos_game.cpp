#include "chaos_game.hpp"

#include <chrono>
#include <utility>

ChaosGame::ChaosGame(const Triangle& triangle, uint64_t iterations, Sampler s,
                     uint32_t foreground)
    : tri(triangle), sampler(std::move(s)), total(iterations), color(foreground)
{
    current = sampler.random_interior_point(tri);
}

// -----------------------------------------------------------------------
// Single transition
// -----------------------------------------------------------------------
StepResult ChaosGame::step(PixelBuffer& buf)
{
    StepResult r;
    if (finished()) {
        r.point = current;
        r.px    = pixel_index(current.x);
        r.py    = pixel_index(current.y);
        return r;
    }

    const Point vertex = sampler.random_vertex(tri);
    current = (current + vertex) * 0.5;

    // Truncate, never round: rounding shifts the pattern by half a pixel.
    r.point  = current;
    r.px     = pixel_index(current.x);
    r.py     = pixel_index(current.y);
    r.status = buf.plot(r.px, r.py, color);

    if (r.status == PlotStatus::Plotted)
        ++counters.plotted;
    else
        ++counters.out_of_bounds;
    ++done;
    return r;
}

// -----------------------------------------------------------------------
// Full run
// -----------------------------------------------------------------------
RunStats ChaosGame::run(PixelBuffer& buf, const ProgressFn& progress,
                        uint64_t progress_interval)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    if (progress_interval == 0)
        progress_interval = 1;

    while (!finished()) {
        step(buf);
        if (progress && (done % progress_interval == 0) && done != total)
            progress(done, total);
    }
    if (progress)
        progress(done, total);

    last_render_ms =
        std::chrono::duration<double, std::milli>(clock::now() - t0).count();
    return counters;
}
