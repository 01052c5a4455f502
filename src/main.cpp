#include "chaos_game.hpp"
#include "cli_benchmark.hpp"
#include "cli_options.hpp"
#include "export.hpp"
#include "output_path.hpp"
#include "pixel_buffer.hpp"
#include "progress_bar.hpp"
#include "render_config.hpp"
#include "version.hpp"

#include <cstdio>
#include <ctime>
#include <functional>
#include <string>

static void print_error(const std::string& msg)
{
    fprintf(stderr, "error: %s\n", msg.c_str());
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    CliOptions opt = parse_args(argc, argv);
    if (!opt.error.empty()) {
        print_error(opt.error);
        fprintf(stderr, "\n%s", opt.help_text.c_str());
        return 1;
    }
    if (opt.want_help) {
        printf("%s", opt.help_text.c_str());
        return 0;
    }
    if (opt.want_version) {
        printf("sierpinski %s\n", SIERPINSKI_VERSION);
        return 0;
    }
    if (opt.benchmark)
        return run_cli_benchmark();

    const RenderConfig& cfg = opt.config;

    const std::string path = make_output_path(cfg, std::time(nullptr));
    const std::string path_err = check_output_path(path);
    if (!path_err.empty()) {
        print_error(path_err);
        return 1;
    }

    Triangle tri;
    try {
        tri = make_triangle(cfg);
    } catch (const DegenerateGeometryError& e) {
        print_error(std::string("invalid triangle: ") + e.what());
        return 1;
    }
    if (!triangle_fits(tri, cfg.width, cfg.height)) {
        const Bounds bb = tri.bounds();
        fprintf(stderr,
                "warning: triangle bounds [%g, %g] x [%g, %g] exceed the %dx%d canvas; "
                "points outside it are skipped\n",
                bb.min_x, bb.max_x, bb.min_y, bb.max_y, cfg.width, cfg.height);
    }

    Sampler sampler = cfg.seed ? Sampler(*cfg.seed) : Sampler::from_entropy();

    // -----------------------------------------------------------------------
    // [1/3] Fractal generation
    // -----------------------------------------------------------------------
    printf("[1/3] Generating fractal (%dx%d, %llu iterations, seed %llu)...\n",
           cfg.width, cfg.height,
           static_cast<unsigned long long>(cfg.iterations),
           static_cast<unsigned long long>(sampler.seed()));
    fflush(stdout);

    PixelBuffer buf;
    buf.resize(cfg.width, cfg.height, cfg.background);

    ChaosGame   game(tri, cfg.iterations, sampler, cfg.foreground);
    ProgressBar bar;
    const RunStats stats = game.run(buf, std::ref(bar));
    bar.finish(cfg.iterations);

    if (stats.out_of_bounds > 0) {
        fprintf(stderr, "warning: %llu of %llu points fell outside the canvas and were skipped\n",
                static_cast<unsigned long long>(stats.out_of_bounds),
                static_cast<unsigned long long>(cfg.iterations));
    }

    // -----------------------------------------------------------------------
    // [2/3] Save
    // -----------------------------------------------------------------------
    printf("[2/3] Saving file...\n");
    fflush(stdout);

    std::string save_err;
#ifdef HAVE_JXL
    if (cfg.format == ImageFormat::Jxl)
        save_err = export_jxl(path, buf);
    else
#endif
        save_err = export_png(path, buf);

    if (!save_err.empty()) {
        print_error(save_err);
        return 1;
    }

    printf("[3/3] Saved to: %s\n", path.c_str());
    return 0;
}
