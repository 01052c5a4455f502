#pragma once

#include "pixel_buffer.hpp"

#include <string>

// Both writers drop the alpha channel: the canvas is always opaque.
// Return empty string on success, or an error message on failure.
std::string export_png(const std::string& path, const PixelBuffer& buf);

#ifdef HAVE_JXL
std::string export_jxl(const std::string& path, const PixelBuffer& buf);
#endif

// True when compiled with JPEG XL support.
inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}
