#pragma once

#include "render_config.hpp"

#include <ctime>
#include <string>

// "<DDHHMMSS>_<W>x<H>_<iterations>.<ext>", timestamp in UTC.
std::string make_output_filename(const RenderConfig& cfg, std::time_t when);

// output_directory joined with the file name for `when`.
std::string make_output_path(const RenderConfig& cfg, std::time_t when);

// Returns empty string when the file's parent directory exists,
// or an error message.
std::string check_output_path(const std::string& path);
