#pragma once

#include "chaos_game.hpp"
#include "render_config.hpp"
#include <cstdio>
#include <algorithm>
#include <vector>

inline int run_cli_benchmark()
{
    constexpr int      RUNS   = 4, BEST_N = 2;
    constexpr uint64_t SEED   = 0x5EED5EEDull;

    struct TestCase {
        const char* label;
        int         width;
        int         height;
        uint64_t    iterations;
    };

    const TestCase tests[] = {
        {"Small canvas",         256,  256,  1000000},
        {"Square HD",           1080, 1080,  4000000},
        {"Wide (square triangle)", 1920, 1080, 4000000},
        {"Large canvas",        4096, 4096,  8000000},
    };

    printf("Sierpinski CLI Benchmark\n");
    printf("1 thread, %d runs (avg best %d), seed %llu\n\n",
           RUNS, BEST_N, static_cast<unsigned long long>(SEED));
    printf("%-26s %-12s %-10s %s\n", "Label", "Canvas", "Iter", "Mpoints/s");
    printf("------------------------------------------------------------\n");

    for (const auto& t : tests) {
        RenderConfig cfg;
        cfg.width      = t.width;
        cfg.height     = t.height;
        cfg.iterations = t.iterations;
        const Triangle tri = make_triangle(cfg);

        PixelBuffer buf;

        // Warm-up
        {
            buf.resize(t.width, t.height);
            ChaosGame game(tri, t.iterations, Sampler(SEED));
            game.run(buf);
        }

        std::vector<double> times(RUNS);
        for (int r = 0; r < RUNS; ++r) {
            buf.resize(t.width, t.height);
            ChaosGame game(tri, t.iterations, Sampler(SEED));
            game.run(buf);
            times[r] = game.last_render_ms;
        }
        std::sort(times.begin(), times.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
        avg_ms /= BEST_N;
        const double mpts = static_cast<double>(t.iterations) / (avg_ms * 1000.0);

        char canvas[32];
        snprintf(canvas, sizeof(canvas), "%dx%d", t.width, t.height);
        printf("%-26s %-12s %-10llu %8.2f\n", t.label, canvas,
               static_cast<unsigned long long>(t.iterations), mpts);
    }

    return 0;
}
