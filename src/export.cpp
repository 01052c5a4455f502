#include "export.hpp"

#include <png.h>
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <vector>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/color_encoding.h>
#endif

// Unpacks one 0xAABBGGRR row into tightly packed 8-bit RGB.
static void pack_rgb_row(const PixelBuffer& buf, int y, std::vector<uint8_t>& out)
{
    const uint32_t* src = buf.pixels.data() + static_cast<size_t>(y) * buf.width;
    for (int x = 0; x < buf.width; ++x) {
        const uint32_t p = src[x];
        out[3 * x + 0] = static_cast<uint8_t>(p);
        out[3 * x + 1] = static_cast<uint8_t>(p >> 8);
        out[3 * x + 2] = static_cast<uint8_t>(p >> 16);
    }
}

// ---------------------------------------------------------------------------
// PNG export (8-bit RGB)
// ---------------------------------------------------------------------------
std::string export_png(const std::string& path, const PixelBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "Cannot write an empty image";

    FILE* fp = std::fopen(path.c_str(), "wb");
    if (!fp)
        return "Cannot open file for writing: " + path;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_write_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    // Allocated before setjmp so a longjmp cannot skip its destructor.
    std::vector<uint8_t> row(static_cast<size_t>(buf.width) * 3);

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return "PNG write error (libpng longjmp)";
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y) {
        pack_rgb_row(buf, y, row);
        png_write_row(png, row.data());
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0)
        return "Error closing file: " + path;
    return {};  // success
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless RGB, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
std::string export_jxl(const std::string& path, const PixelBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "Cannot write an empty image";

    std::vector<uint8_t> rgb(static_cast<size_t>(buf.width) * buf.height * 3);
    {
        std::vector<uint8_t> row(static_cast<size_t>(buf.width) * 3);
        for (int y = 0; y < buf.height; ++y) {
            pack_rgb_row(buf, y, row);
            std::copy(row.begin(), row.end(), rgb.begin() + static_cast<size_t>(y) * row.size());
        }
    }

    JxlEncoder* enc = JxlEncoderCreate(nullptr);
    if (!enc) return "JxlEncoderCreate failed";

    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                    = static_cast<uint32_t>(buf.width);
    bi.ysize                    = static_cast<uint32_t>(buf.height);
    bi.bits_per_sample          = 8;
    bi.exponent_bits_per_sample = 0;
    bi.num_color_channels       = 3;
    bi.uses_original_profile    = JXL_TRUE;

    if (JxlEncoderSetBasicInfo(enc, &bi) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetBasicInfo failed";
    }

    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, /*is_gray=*/JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc, &color) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetColorEncoding failed";
    }

    JxlEncoderFrameSettings* opts = JxlEncoderFrameSettingsCreate(enc, nullptr);
    if (JxlEncoderSetFrameLossless(opts, JXL_TRUE) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetFrameLossless failed";
    }

    JxlPixelFormat fmt = {3, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(opts, &fmt, rgb.data(), rgb.size())
            != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderAddImageFrame failed";
    }
    JxlEncoderCloseInput(enc);

    std::vector<uint8_t> output(65536);
    uint8_t* next_out  = output.data();
    size_t   avail_out = output.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc, &next_out, &avail_out))
               == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t used = next_out - output.data();
        output.resize(output.size() * 2);
        next_out  = output.data() + used;
        avail_out = output.size() - used;
    }
    JxlEncoderDestroy(enc);

    if (status != JXL_ENC_SUCCESS)
        return "JxlEncoderProcessOutput failed";

    output.resize(static_cast<size_t>(next_out - output.data()));

    FILE* fp = std::fopen(path.c_str(), "wb");
    if (!fp) return "Cannot open file for writing: " + path;
    const size_t written = std::fwrite(output.data(), 1, output.size(), fp);
    const bool   closed  = std::fclose(fp) == 0;
    if (written != output.size() || !closed)
        return "Short write: " + path;
    return {};  // success
}
#endif  // HAVE_JXL
