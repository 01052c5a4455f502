#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>

// Single-line console progress bar, redrawn in place with '\r'.
// Redraws are throttled so a tight loop can report every few thousand steps.
class ProgressBar {
public:
    explicit ProgressBar(FILE* out = stderr, int bar_width = 40);

    void update(uint64_t done, uint64_t total);

    // Draws the completed bar and a closing line with the elapsed time.
    void finish(uint64_t total);

    // Callable as a ProgressFn.
    void operator()(uint64_t done, uint64_t total) { update(done, total); }

private:
    void draw(uint64_t done, uint64_t total, double elapsed_s);

    using clock = std::chrono::steady_clock;

    FILE*             out;
    int               width;
    int               spin      = 0;
    bool              drawn     = false;
    clock::time_point start;
    clock::time_point last_draw;
};
