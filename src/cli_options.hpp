#pragma once

#include "render_config.hpp"

#include <string>

struct CliOptions {
    RenderConfig config;
    bool         want_help    = false;
    bool         want_version = false;
    bool         benchmark    = false;
    std::string  help_text;
    std::string  error;          // non-empty when parsing failed
};

// Parse command-line arguments with cxxopts. Never throws: bad input is
// reported through CliOptions::error (with help_text filled in).
CliOptions parse_args(int argc, char** argv);

// "x1,y1,x2,y2,x3,y3" -> three points. Returns false on malformed input.
bool parse_points(const std::string& s, std::array<Point, 3>& out);

// "RRGGBB" or "#RRGGBB" -> opaque packed color. Returns false on malformed input.
bool parse_color(const std::string& s, uint32_t& out);
