// cli_options.cpp — command-line parsing using cxxopts

#include "cli_options.hpp"
#include "export.hpp"
#include "version.hpp"

#include <cxxopts.hpp>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <sstream>
#include <vector>

bool parse_points(const std::string& s, std::array<Point, 3>& out)
{
    std::vector<double> v;
    std::stringstream   ss(s);
    std::string         item;
    while (std::getline(ss, item, ',')) {
        char* endp = nullptr;
        const double d = std::strtod(item.c_str(), &endp);
        if (item.empty() || endp == item.c_str() || *endp != '\0')
            return false;
        v.push_back(d);
    }
    if (v.size() != 6)
        return false;
    for (int i = 0; i < 3; ++i)
        out[i] = Point{v[2 * i], v[2 * i + 1]};
    return true;
}

bool parse_color(const std::string& s, uint32_t& out)
{
    std::string hex = (!s.empty() && s[0] == '#') ? s.substr(1) : s;
    if (hex.size() != 6)
        return false;
    for (char ch : hex)
        if (!std::isxdigit(static_cast<unsigned char>(ch)))
            return false;
    const unsigned long v = std::strtoul(hex.c_str(), nullptr, 16);
    out = rgba(static_cast<uint8_t>(v >> 16), static_cast<uint8_t>(v >> 8),
               static_cast<uint8_t>(v));
    return true;
}

CliOptions parse_args(int argc, char** argv)
{
    CliOptions    opt;
    RenderConfig& cfg = opt.config;

    int         size = 0;
    std::string points_s;
    std::string color_s;
    std::string format_s;
    uint64_t    seed = 0;

    cxxopts::Options desc("sierpinski", "Render a Sierpinski triangle with the chaos game");
    desc.add_options()
        ("h,help",    "Show this help")
        ("v,version", "Print version and exit")
        ("s,size",    "Square canvas size in pixels", cxxopts::value<int>(size))
        ("W,width",   "Canvas width in pixels (with --height)", cxxopts::value<int>(cfg.width))
        ("H,height",  "Canvas height in pixels (with --width)", cxxopts::value<int>(cfg.height))
        ("q,quality", "Number of iterations", cxxopts::value<uint64_t>(cfg.iterations)->default_value("4000000"))
        ("d,output-directory", "Directory the image is written to", cxxopts::value<std::string>(cfg.output_directory)->default_value("./"))
        ("side",      "Equilateral side length (default: min(width, height))", cxxopts::value<double>(cfg.side_length))
        ("points",    "Explicit triangle as x1,y1,x2,y2,x3,y3", cxxopts::value<std::string>(points_s))
        ("seed",      "RNG seed (default: random)", cxxopts::value<uint64_t>(seed))
        ("color",     "Foreground color as RRGGBB", cxxopts::value<std::string>(color_s)->default_value("ffffff"))
        ("format",    "Output format: png or jxl", cxxopts::value<std::string>(format_s)->default_value("png"))
        ("benchmark", "Run the iteration benchmark and exit")
    ;
    opt.help_text = desc.help();

    try {
        auto result = desc.parse(argc, argv);

        if (result.count("help"))      { opt.want_help = true;    return opt; }
        if (result.count("version"))   { opt.want_version = true; return opt; }
        if (result.count("benchmark")) { opt.benchmark = true;    return opt; }

        if (result.count("size")) {
            if (result.count("width") || result.count("height")) {
                opt.error = "--size cannot be combined with --width/--height";
                return opt;
            }
            cfg.width  = size;
            cfg.height = size;
        } else if (!result.count("width") || !result.count("height")) {
            opt.error = "either --size or both --width and --height are required";
            return opt;
        }

        if (result.count("points") && result.count("side")) {
            opt.error = "--points cannot be combined with --side";
            return opt;
        }
        if (result.count("points")) {
            if (!parse_points(points_s, cfg.points)) {
                opt.error = "invalid --points; expected x1,y1,x2,y2,x3,y3";
                return opt;
            }
            cfg.sizing = TriangleSizing::ExplicitPoints;
        } else if (result.count("side")) {
            cfg.sizing = TriangleSizing::SideLength;
        }

        if (result.count("seed"))
            cfg.seed = seed;

        if (!parse_color(color_s, cfg.foreground)) {
            opt.error = "invalid --color; expected RRGGBB";
            return opt;
        }

        if (format_s == "png") {
            cfg.format = ImageFormat::Png;
        } else if (format_s == "jxl") {
            if (!jxl_available()) {
                opt.error = "this build has no JPEG XL support";
                return opt;
            }
            cfg.format = ImageFormat::Jxl;
        } else {
            opt.error = "invalid --format '" + format_s + "'; expected png or jxl";
            return opt;
        }
    } catch (const std::exception& e) {
        opt.error = e.what();
        return opt;
    }

    opt.error = validate(cfg);
    return opt;
}
