#include "progress_bar.hpp"

#include <string>

static constexpr double REDRAW_INTERVAL_S = 0.1;

ProgressBar::ProgressBar(FILE* o, int bar_width)
    : out(o), width(bar_width < 1 ? 1 : bar_width),
      start(clock::now()), last_draw(start)
{
}

void ProgressBar::update(uint64_t done, uint64_t total)
{
    const auto   now     = clock::now();
    const double since   = std::chrono::duration<double>(now - last_draw).count();
    if (drawn && since < REDRAW_INTERVAL_S && done < total)
        return;
    last_draw = now;
    draw(done, total, std::chrono::duration<double>(now - start).count());
}

void ProgressBar::finish(uint64_t total)
{
    const double elapsed = std::chrono::duration<double>(clock::now() - start).count();
    draw(total, total, elapsed);
    std::fprintf(out, "\nFinished in %.3fs.\n", elapsed);
    std::fflush(out);
}

// -----------------------------------------------------------------------
// "<spinner> [hh:mm:ss] [#####>-----]  done/total (eta)"
// -----------------------------------------------------------------------
void ProgressBar::draw(uint64_t done, uint64_t total, double elapsed_s)
{
    static const char spinner[] = {'|', '/', '-', '\\'};

    const double frac   = total ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    const int    filled = static_cast<int>(frac * width);

    std::string bar(static_cast<size_t>(width), '-');
    for (int i = 0; i < filled && i < width; ++i) bar[i] = '#';
    if (filled < width) bar[filled] = '>';

    const double eta = (done > 0 && done < total)
        ? elapsed_s * static_cast<double>(total - done) / static_cast<double>(done)
        : 0.0;

    const long secs = static_cast<long>(elapsed_s);
    std::fprintf(out, "\r%c [%02ld:%02ld:%02ld] [%s] %7llu/%-7llu (%.1fs)",
                 spinner[spin++ & 3],
                 secs / 3600, (secs / 60) % 60, secs % 60,
                 bar.c_str(),
                 static_cast<unsigned long long>(done),
                 static_cast<unsigned long long>(total),
                 eta);
    std::fflush(out);
    drawn = true;
}
