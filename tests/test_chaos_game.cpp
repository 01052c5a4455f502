// tests/test_chaos_game.cpp
//
// Chaos-game engine: hull containment, replay, the zero-iteration no-op,
// canvas-boundary rejection, progress reporting and the Sierpinski gap.

#include <doctest/doctest.h>

#include "chaos_game.hpp"
#include "render_config.hpp"

#include <cmath>
#include <limits>
#include <utility>
#include <vector>

namespace {

std::vector<std::pair<int64_t, int64_t>> pixel_sequence(const Triangle& t, uint64_t n,
                                                        uint64_t seed, int w, int h)
{
    PixelBuffer buf;
    buf.resize(w, h);
    ChaosGame game(t, n, Sampler(seed));
    std::vector<std::pair<int64_t, int64_t>> seq;
    while (!game.finished()) {
        const StepResult r = game.step(buf);
        seq.emplace_back(r.px, r.py);
    }
    return seq;
}

size_t count_color(const PixelBuffer& buf, uint32_t color)
{
    size_t n = 0;
    for (uint32_t p : buf.pixels)
        n += (p == color);
    return n;
}

} // namespace

TEST_CASE("Every point, including the initial one, stays in the triangle's hull")
{
    const Triangle tris[] = {
        equilateral(100.0),
        from_three_points({5.0, 60.0}, {90.0, 10.0}, {70.0, 95.0}),
    };
    for (const Triangle& t : tris) {
        for (uint64_t seed : {1ull, 17ull, 123456789ull}) {
            PixelBuffer buf;
            buf.resize(100, 100);
            ChaosGame game(t, 5000, Sampler(seed));
            REQUIRE(contains(t, game.current_point()));
            while (!game.finished())
                REQUIRE(contains(t, game.step(buf).point));
        }
    }
}

TEST_CASE("Fixed seed, triangle and iteration count replay identically")
{
    const Triangle t = equilateral(200.0);
    const auto first  = pixel_sequence(t, 3000, 555, 200, 200);
    const auto second = pixel_sequence(t, 3000, 555, 200, 200);
    CHECK(first.size() == 3000);
    CHECK(first == second);

    PixelBuffer b1, b2;
    b1.resize(200, 200);
    b2.resize(200, 200);
    ChaosGame(t, 3000, Sampler(555)).run(b1);
    ChaosGame(t, 3000, Sampler(555)).run(b2);
    CHECK(b1.pixels == b2.pixels);
}

TEST_CASE("Zero iterations leave the canvas at background")
{
    PixelBuffer buf;
    buf.resize(64, 48, COLOR_BLACK);

    ChaosGame game(equilateral(48.0), 0, Sampler(3));
    CHECK(game.finished());

    int calls = 0;
    const RunStats stats = game.run(buf, [&](uint64_t done, uint64_t total) {
        ++calls;
        CHECK(done == 0);
        CHECK(total == 0);
    });

    CHECK(stats.plotted == 0);
    CHECK(stats.out_of_bounds == 0);
    CHECK(calls == 1);
    CHECK(count_color(buf, COLOR_BLACK) == buf.pixels.size());
}

TEST_CASE("Each transition lands on the midpoint toward a vertex and truncates")
{
    const Triangle t = equilateral(100.0);
    PixelBuffer buf;
    buf.resize(100, 100);
    ChaosGame game(t, 200, Sampler(8));

    while (!game.finished()) {
        const Point before = game.current_point();
        const StepResult r = game.step(buf);

        bool is_midpoint = false;
        for (const Point& v : t.vertices())
            is_midpoint = is_midpoint || ((before + v) * 0.5 == r.point);
        REQUIRE(is_midpoint);

        CHECK(r.px == static_cast<int64_t>(std::floor(r.point.x)));
        CHECK(r.py == static_cast<int64_t>(std::floor(r.point.y)));
        CHECK(r.status == PlotStatus::Plotted);
        CHECK(buf.at(static_cast<int>(r.px), static_cast<int>(r.py)) == COLOR_WHITE);
    }
    CHECK(game.iterations_done() == 200);
    CHECK(game.stats().plotted == 200);
}

TEST_CASE("Side 100 triangle with N = 1000 stays inside [0,100] x [0,87]")
{
    const auto seq = pixel_sequence(equilateral(100.0), 1000, 2718, 100, 100);
    REQUIRE(seq.size() == 1000);
    for (const auto& p : seq) {
        CHECK(p.first >= 0);
        CHECK(p.first <= 100);
        CHECK(p.second >= 0);
        CHECK(p.second <= 87);
    }
}

TEST_CASE("Central inverted sub-triangle stays empty")
{
    const Triangle t = equilateral(200.0);
    PixelBuffer buf;
    buf.resize(200, 200);
    ChaosGame game(t, 50000, Sampler(31337));
    const RunStats stats = game.run(buf);
    CHECK(stats.plotted + stats.out_of_bounds == 50000);

    // Central triangle spanned by the edge midpoints. A pixel whose centre is
    // more than one pixel diagonal inside it cannot hold a plotted point.
    const Triangle gap{(t.a + t.b) * 0.5, (t.b + t.c) * 0.5, (t.a + t.c) * 0.5};
    const Point    centre = (gap.a + gap.b + gap.c) * (1.0 / 3.0);

    size_t inside = 0, plotted_inside = 0;
    for (int y = 0; y < buf.height; ++y) {
        for (int x = 0; x < buf.width; ++x) {
            const Point pc{x + 0.5, y + 0.5};
            // Shrink the gap towards its centre by a 3-pixel margin.
            const Point scaled = centre + (pc - centre) * 1.15;
            if (!contains(gap, scaled, 0.0))
                continue;
            ++inside;
            plotted_inside += (buf.at(x, y) == COLOR_WHITE);
        }
    }
    CHECK(inside > 1000);
    CHECK(plotted_inside == 0);

    // The corners, in contrast, are well populated.
    CHECK(stats.plotted > 10000);
}

TEST_CASE("Out-of-canvas pixels are skipped and the run continues")
{
    // Triangle twice the size of the canvas.
    const Triangle t = equilateral(100.0);
    PixelBuffer buf;
    buf.resize(50, 50);
    ChaosGame game(t, 4000, Sampler(11));
    const RunStats stats = game.run(buf);

    CHECK(game.finished());
    CHECK(stats.plotted > 0);
    CHECK(stats.out_of_bounds > 0);
    CHECK(stats.plotted + stats.out_of_bounds == 4000);
    CHECK(count_color(buf, COLOR_WHITE) > 0);
}

TEST_CASE("Coordinates beyond the int64 range are rejected at the canvas")
{
    RenderConfig cfg;
    cfg.width  = 100;
    cfg.height = 100;
    cfg.sizing = TriangleSizing::ExplicitPoints;
    cfg.points = {Point{0.0, 0.0}, Point{1e20, 0.0}, Point{0.0, 1e20}};

    PixelBuffer buf;
    buf.resize(cfg.width, cfg.height);
    ChaosGame game(make_triangle(cfg), 50, Sampler(6));
    const RunStats stats = game.run(buf);

    CHECK(stats.plotted == 0);
    CHECK(stats.out_of_bounds == 50);
    CHECK(count_color(buf, COLOR_BLACK) == buf.pixels.size());

    // The finished-state report goes through the same conversion.
    const StepResult r = game.step(buf);
    CHECK_FALSE(buf.in_bounds(r.px, r.py));
}

TEST_CASE("pixel_index floors and saturates")
{
    CHECK(pixel_index(3.99) == 3);
    CHECK(pixel_index(-0.5) == -1);
    CHECK(pixel_index(0.0) == 0);
    CHECK(pixel_index(1e20) == std::numeric_limits<int64_t>::max());
    CHECK(pixel_index(-1e20) == std::numeric_limits<int64_t>::min());
    CHECK(pixel_index(std::nan("")) == std::numeric_limits<int64_t>::max());
    CHECK(pixel_index(std::numeric_limits<double>::infinity()) == std::numeric_limits<int64_t>::max());
}

TEST_CASE("PixelBuffer::plot rejects writes outside the canvas")
{
    PixelBuffer buf;
    buf.resize(4, 3, COLOR_BLACK);

    CHECK(buf.plot(-1, 0, COLOR_WHITE) == PlotStatus::OutOfBounds);
    CHECK(buf.plot(0, -1, COLOR_WHITE) == PlotStatus::OutOfBounds);
    CHECK(buf.plot(4, 0, COLOR_WHITE) == PlotStatus::OutOfBounds);
    CHECK(buf.plot(0, 3, COLOR_WHITE) == PlotStatus::OutOfBounds);
    CHECK(count_color(buf, COLOR_BLACK) == 12);

    CHECK(buf.plot(3, 2, COLOR_WHITE) == PlotStatus::Plotted);
    CHECK(buf.at(3, 2) == COLOR_WHITE);
    CHECK(count_color(buf, COLOR_BLACK) == 11);
}

TEST_CASE("Progress reporting does not change the output")
{
    const Triangle t = equilateral(128.0);

    PixelBuffer quiet, observed;
    quiet.resize(128, 128);
    observed.resize(128, 128);

    ChaosGame(t, 10000, Sampler(4)).run(quiet);

    std::vector<std::pair<uint64_t, uint64_t>> reports;
    ChaosGame game(t, 10000, Sampler(4));
    game.run(observed, [&](uint64_t done, uint64_t total) {
        reports.emplace_back(done, total);
    }, 1000);

    CHECK(quiet.pixels == observed.pixels);

    REQUIRE(reports.size() == 10);
    for (size_t i = 0; i < reports.size(); ++i) {
        CHECK(reports[i].first == (i + 1) * 1000);
        CHECK(reports[i].second == 10000);
    }
    CHECK(reports.back().first == 10000);
}

TEST_CASE("Stopping early leaves a consistent partial render")
{
    const Triangle t = equilateral(64.0);
    PixelBuffer partial, full;
    partial.resize(64, 64);
    full.resize(64, 64);

    ChaosGame game(t, 1000, Sampler(21));
    for (int i = 0; i < 300; ++i)
        game.step(partial);
    CHECK_FALSE(game.finished());
    CHECK(game.iterations_done() == 300);

    // Finishing the same game yields the full render.
    game.run(partial);
    ChaosGame(t, 1000, Sampler(21)).run(full);
    CHECK(partial.pixels == full.pixels);

    // Further steps are no-ops.
    const Point last = game.current_point();
    game.step(partial);
    CHECK(game.iterations_done() == 1000);
    CHECK(game.current_point() == last);
}

TEST_CASE("Foreground color is the only color written")
{
    const uint32_t orange = rgba(0xFF, 0x80, 0x00);
    PixelBuffer buf;
    buf.resize(32, 32, COLOR_BLACK);
    ChaosGame(equilateral(32.0), 2000, Sampler(5), orange).run(buf);

    for (uint32_t p : buf.pixels)
        CHECK((p == COLOR_BLACK || p == orange));
    CHECK(count_color(buf, orange) > 0);
}
