//
// Created by Giuseppe Francione on 19/10/26.
//

#include "../../include/image_info.hpp"
#include "../../include/logger.hpp"
#include "../../include/tag_error.hpp"
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <string>
#include <png.h>
#include <jpeglib.h>

namespace tagmerge {

namespace {

constexpr const char* kTag = "image_info";

[[noreturn]] void fail(const std::string& msg) {
    Logger::log(LogLevel::Error, msg, kTag);
    throw TagError(ErrorKind::PictureEncode, msg);
}

//
// png
//

struct PngSource {
    const unsigned char* data = nullptr;
    std::size_t size = 0;
    std::size_t offset = 0;
};

void png_read_from_memory(png_structp png, png_bytep out, const png_size_t length) {
    auto* src = static_cast<PngSource*>(png_get_io_ptr(png));
    if (!src || src->offset + length > src->size) {
        png_error(png, "unexpected end of png data");
    }
    std::memcpy(out, src->data + src->offset, length);
    src->offset += length;
}

void png_error_fn_quiet(png_structp png, png_const_charp msg) {
    Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, kTag);
    png_longjmp(png, 1);
}

void png_warning_fn_quiet(png_structp, png_const_charp msg) {
    Logger::log(LogLevel::Debug, std::string("libpng (warn): ") + msg, kTag);
}

// raii wrapper for libpng read structs
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;
    explicit PngRead() {
        png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn_quiet, png_warning_fn_quiet);
        if (png) {
            info = png_create_info_struct(png);
        }
    }
    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
    PngRead(const PngRead&) = delete;
    PngRead& operator=(const PngRead&) = delete;
    [[nodiscard]] bool isValid() const { return png && info; }
};

// returns false when libpng rejects the header
bool read_png_header(const std::span<const unsigned char> bytes, ImageInfo& out) {
    PngRead rd;
    if (!rd.isValid()) {
        return false;
    }
    PngSource src{bytes.data(), bytes.size(), 0};

    if (setjmp(png_jmpbuf(rd.png))) {
        return false;
    }

    png_set_read_fn(rd.png, &src, png_read_from_memory);
    png_read_info(rd.png, rd.info);

    png_uint_32 w = 0, h = 0;
    int bit_depth = 0, color_type = 0;
    png_get_IHDR(rd.png, rd.info, &w, &h, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    out.width = w;
    out.height = h;
    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        out.depth = static_cast<std::uint32_t>(bit_depth);
        png_colorp palette = nullptr;
        int num_palette = 0;
        if (png_get_PLTE(rd.png, rd.info, &palette, &num_palette) == PNG_INFO_PLTE) {
            out.colors = static_cast<std::uint32_t>(num_palette);
        }
    } else {
        const int channels = png_get_channels(rd.png, rd.info);
        out.depth = static_cast<std::uint32_t>(bit_depth * channels);
        out.colors = 0;
    }
    return true;
}

//
// jpeg
//

struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    jmp_buf setjmp_buffer{};
};

void jpeg_error_exit_jump(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, kTag);
    longjmp(err->setjmp_buffer, 1);
}

void jpeg_output_message_quiet(j_common_ptr) {}

bool read_jpeg_header(const std::span<const unsigned char> bytes, ImageInfo& out) {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};

    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_jump;
    jerr.pub.output_message = jpeg_output_message_quiet;

    if (setjmp(jerr.setjmp_buffer)) {
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    jpeg_create_decompress(&cinfo);
    // older libjpeg releases take a non-const buffer
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(bytes.data()), static_cast<unsigned long>(bytes.size()));
    jpeg_read_header(&cinfo, TRUE);

    out.width = cinfo.image_width;
    out.height = cinfo.image_height;
    out.depth = static_cast<std::uint32_t>(cinfo.num_components * cinfo.data_precision);
    out.colors = 0;

    jpeg_destroy_decompress(&cinfo);
    return true;
}

bool is_png_mime(const std::string_view mime) {
    return mime == "image/png";
}

bool is_jpeg_mime(const std::string_view mime) {
    return mime == "image/jpeg" || mime == "image/jpg";
}

} // namespace

bool is_supported_image_mime(const std::string_view mime_type) noexcept {
    return is_png_mime(mime_type) || is_jpeg_mime(mime_type);
}

ImageInfo read_image_info(const std::span<const unsigned char> bytes, const std::string_view mime_type) {
    if (!is_supported_image_mime(mime_type)) {
        fail("unsupported cover mime type: '" + std::string(mime_type) + "'");
    }
    if (bytes.empty()) {
        fail("empty cover image data");
    }

    ImageInfo info;
    if (is_png_mime(mime_type)) {
        if (bytes.size() < 8 || png_sig_cmp(bytes.data(), 0, 8) != 0) {
            fail("cover data is not a png image");
        }
        if (!read_png_header(bytes, info)) {
            fail("failed to read png header of cover image");
        }
    } else {
        if (!read_jpeg_header(bytes, info)) {
            fail("failed to read jpeg header of cover image");
        }
    }

    if (info.width == 0 || info.height == 0) {
        fail("cover image has zero dimensions");
    }

    Logger::log(LogLevel::Debug,
                std::string(mime_type) + " " + std::to_string(info.width) + "x" +
                std::to_string(info.height) + " depth " + std::to_string(info.depth),
                kTag);
    return info;
}

} // namespace tagmerge
