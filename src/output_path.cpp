#include "output_path.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

std::string make_output_filename(const RenderConfig& cfg, std::time_t when)
{
    char ts[32];
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &when);
#else
    gmtime_r(&when, &tm_buf);
#endif
    std::strftime(ts, sizeof(ts), "%d%H%M%S", &tm_buf);

    char name[128];
    std::snprintf(name, sizeof(name), "%s_%dx%d_%llu.%s",
                  ts, cfg.width, cfg.height,
                  static_cast<unsigned long long>(cfg.iterations),
                  format_extension(cfg.format));
    return name;
}

std::string make_output_path(const RenderConfig& cfg, std::time_t when)
{
    return (fs::path(cfg.output_directory) / make_output_filename(cfg, when)).string();
}

std::string check_output_path(const std::string& path)
{
    const fs::path p(path);
    if (!p.has_filename())
        return "Invalid path: " + path;

    // A bare file name lives in the current directory.
    const fs::path parent = p.has_parent_path() ? p.parent_path() : fs::path(".");

    std::error_code ec;
    if (!fs::is_directory(parent, ec))
        return "Directory \"" + parent.string() + "\" does not exist";
    return {};
}
