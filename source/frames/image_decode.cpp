#include "frames/image_decode.hpp"

#include <csetjmp>
#include <cstdio>
#include <cstring>

#include <jpeglib.h>
#include <png.h>

namespace image_decode {

namespace {

// libjpeg reports fatal errors through error_exit; we jump back out of the decoder.
struct JpegErrorManager {
    jpeg_error_mgr base;
    jmp_buf jump_buffer;
    char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit(j_common_ptr common_info) {
    JpegErrorManager *error_manager = reinterpret_cast<JpegErrorManager *>(common_info->err);
    (*common_info->err->format_message)(common_info, error_manager->message);
    longjmp(error_manager->jump_buffer, 1);
}

void jpeg_silent_output(j_common_ptr common_info) {
    (void)common_info;
}

// Only plain C objects live in this frame so the longjmp path skips no destructors.
bool decode_jpeg(const uint8_t *data, size_t size, RasterImage &out_image, std::string &error_detail) {
    jpeg_decompress_struct decompress_info;
    JpegErrorManager error_manager;
    std::memset(error_manager.message, 0, sizeof(error_manager.message));

    decompress_info.err = jpeg_std_error(&error_manager.base);
    error_manager.base.error_exit = jpeg_error_exit;
    error_manager.base.output_message = jpeg_silent_output;

    if (setjmp(error_manager.jump_buffer)) {
        jpeg_destroy_decompress(&decompress_info);
        error_detail = std::string("JPEG decode failed: ") + error_manager.message;
        return false;
    }

    jpeg_create_decompress(&decompress_info);
    jpeg_mem_src(&decompress_info, const_cast<unsigned char *>(data), static_cast<unsigned long>(size));
    jpeg_read_header(&decompress_info, TRUE);
    decompress_info.out_color_space = JCS_RGB;
    jpeg_start_decompress(&decompress_info);

    const int width = static_cast<int>(decompress_info.output_width);
    const int height = static_cast<int>(decompress_info.output_height);
    const int components = decompress_info.output_components;
    if (components != 3) {
        jpeg_destroy_decompress(&decompress_info);
        error_detail = "JPEG decode failed: unexpected component count " + std::to_string(components);
        return false;
    }

    out_image.width = width;
    out_image.height = height;
    out_image.rgba.assign(static_cast<size_t>(width) * static_cast<size_t>(height) * 4, 255);

    JSAMPARRAY row_buffer = (*decompress_info.mem->alloc_sarray)(
        reinterpret_cast<j_common_ptr>(&decompress_info), JPOOL_IMAGE,
        static_cast<JDIMENSION>(width * components), 1);

    while (decompress_info.output_scanline < decompress_info.output_height) {
        const size_t row_index = decompress_info.output_scanline;
        jpeg_read_scanlines(&decompress_info, row_buffer, 1);
        uint8_t *destination = out_image.rgba.data() + row_index * static_cast<size_t>(width) * 4;
        const uint8_t *source = row_buffer[0];
        for (int column = 0; column < width; column++) {
            destination[column * 4] = source[column * 3];
            destination[column * 4 + 1] = source[column * 3 + 1];
            destination[column * 4 + 2] = source[column * 3 + 2];
        }
    }

    jpeg_finish_decompress(&decompress_info);
    jpeg_destroy_decompress(&decompress_info);
    return true;
}

bool decode_png(const uint8_t *data, size_t size, RasterImage &out_image, std::string &error_detail) {
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&image, data, size)) {
        error_detail = std::string("PNG decode failed: ") + image.message;
        return false;
    }

    image.format = PNG_FORMAT_RGBA;
    out_image.width = static_cast<int>(image.width);
    out_image.height = static_cast<int>(image.height);
    out_image.rgba.resize(PNG_IMAGE_SIZE(image));

    if (!png_image_finish_read(&image, nullptr, out_image.rgba.data(), 0, nullptr)) {
        error_detail = std::string("PNG decode failed: ") + image.message;
        png_image_free(&image);
        return false;
    }
    return true;
}

} // namespace

ImageFormat detect_format(const uint8_t *data, size_t size) {
    static const uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (size >= 8 && std::memcmp(data, PNG_SIGNATURE, 8) == 0) {
        return ImageFormat::Png;
    }
    if (size >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return ImageFormat::Jpeg;
    }
    return ImageFormat::Unknown;
}

bool decode(const uint8_t *data, size_t size, RasterImage &out_image, std::string &error_detail) {
    if (data == nullptr || size == 0) {
        error_detail = "empty image payload";
        return false;
    }
    switch (detect_format(data, size)) {
    case ImageFormat::Jpeg:
        return decode_jpeg(data, size, out_image, error_detail);
    case ImageFormat::Png:
        return decode_png(data, size, out_image, error_detail);
    case ImageFormat::Unknown:
        break;
    }
    error_detail = "unrecognized image format";
    return false;
}

bool decode(const std::vector<uint8_t> &encoded, RasterImage &out_image, std::string &error_detail) {
    return decode(encoded.data(), encoded.size(), out_image, error_detail);
}

} // namespace image_decode
