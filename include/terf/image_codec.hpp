#pragma once

/// \file image_codec.hpp
/// \brief Header probing for the image formats accepted by `terf build`.
///
/// Only the image configuration is decoded (dimensions, format and colour
/// model); pixel data is never expanded. JPEG and PNG headers are read with
/// libjpeg and libpng, GIF headers are parsed directly.

#include <csetjmp>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>

#include <jpeglib.h>
#include <png.h>

#include "terf/errors.hpp"

namespace terf {

/// Configuration of an encoded image.
struct ImageInfo {
    int width{0};
    int height{0};
    std::string format{};     ///< "jpeg", "png" or "gif"
    std::string colorspace{}; ///< "RGB", "CMYK", "Gray" or "Unknown"
};

namespace detail {

struct JpegErrorManager {
    jpeg_error_mgr pub;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

extern "C" inline void terf_jpeg_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    std::longjmp(err->jump, 1);
}

extern "C" inline void terf_jpeg_silent(j_common_ptr, int) {}

// Only trivially destructible objects live in this frame because libjpeg
// reports errors with longjmp.
inline bool probe_jpeg_header(const unsigned char* data, std::size_t size, int& width,
                              int& height, J_COLOR_SPACE& space, char* message) {
    jpeg_decompress_struct cinfo;
    JpegErrorManager err;
    cinfo.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = terf_jpeg_error_exit;
    err.pub.emit_message = terf_jpeg_silent;
    err.message[0] = '\0';
    if (setjmp(err.jump)) {
        std::strncpy(message, err.message, JMSG_LENGTH_MAX);
        jpeg_destroy_decompress(&cinfo);
        return false;
    }
    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(data), static_cast<unsigned long>(size));
    jpeg_read_header(&cinfo, TRUE);
    width = static_cast<int>(cinfo.image_width);
    height = static_cast<int>(cinfo.image_height);
    space = cinfo.jpeg_color_space;
    jpeg_destroy_decompress(&cinfo);
    return true;
}

inline ImageInfo probe_jpeg(std::string_view bytes) {
    ImageInfo info;
    info.format = "jpeg";
    J_COLOR_SPACE space = JCS_UNKNOWN;
    char message[JMSG_LENGTH_MAX] = {0};
    if (!probe_jpeg_header(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
                           info.width, info.height, space, message))
        throw ConversionError(std::string("invalid JPEG: ") + message);
    switch (space) {
    case JCS_GRAYSCALE:
        info.colorspace = "Gray";
        break;
    case JCS_YCbCr:
    case JCS_RGB:
        info.colorspace = "RGB";
        break;
    case JCS_CMYK:
    case JCS_YCCK:
        info.colorspace = "CMYK";
        break;
    default:
        info.colorspace = "Unknown";
        break;
    }
    return info;
}

inline ImageInfo probe_png(std::string_view bytes) {
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_memory(&image, bytes.data(), bytes.size())) {
        std::string msg = std::string("invalid PNG: ") + image.message;
        png_image_free(&image);
        throw ConversionError(msg);
    }
    ImageInfo info;
    info.format = "png";
    info.width = static_cast<int>(image.width);
    info.height = static_cast<int>(image.height);
    if (image.format & PNG_FORMAT_FLAG_COLORMAP)
        info.colorspace = "Unknown";
    else if (image.format & (PNG_FORMAT_FLAG_COLOR | PNG_FORMAT_FLAG_ALPHA))
        info.colorspace = "RGB";
    else
        info.colorspace = "Gray";
    png_image_free(&image);
    return info;
}

inline ImageInfo probe_gif(std::string_view bytes) {
    if (bytes.size() < 10 ||
        (bytes.substr(0, 6) != "GIF87a" && bytes.substr(0, 6) != "GIF89a"))
        throw ConversionError("invalid GIF header");
    auto u16 = [&](std::size_t off) {
        return static_cast<int>(static_cast<unsigned char>(bytes[off]) |
                                (static_cast<unsigned char>(bytes[off + 1]) << 8));
    };
    ImageInfo info;
    info.format = "gif";
    info.width = u16(6);
    info.height = u16(8);
    // Palette based images carry no single colour model.
    info.colorspace = "Unknown";
    return info;
}

} // namespace detail

/**
 * @brief Decode the configuration of an encoded image.
 *
 * The format is detected from the leading magic bytes. Throws
 * ConversionError for unknown formats and corrupt headers.
 */
inline ImageInfo probe_image(std::string_view bytes) {
    static const unsigned char kPngMagic[8] = {0x89, 'P', 'N', 'G', 0x0d, 0x0a, 0x1a, 0x0a};
    auto byte = [&](std::size_t i) { return static_cast<unsigned char>(bytes[i]); };
    if (bytes.size() >= 3 && byte(0) == 0xff && byte(1) == 0xd8 && byte(2) == 0xff)
        return detail::probe_jpeg(bytes);
    if (bytes.size() >= 8 && std::memcmp(bytes.data(), kPngMagic, 8) == 0)
        return detail::probe_png(bytes);
    if (bytes.size() >= 4 && bytes.substr(0, 4) == "GIF8")
        return detail::probe_gif(bytes);
    throw ConversionError("unknown image format");
}

} // namespace terf
