//
// Created by Giuseppe Francione on 19/10/26.
//

#ifndef TAGMERGE_IMAGE_INFO_HPP
#define TAGMERGE_IMAGE_INFO_HPP

#include <cstdint>
#include <span>
#include <string_view>

namespace tagmerge {

/**
 * @brief Technical picture fields required by FLAC PICTURE blocks.
 */
struct ImageInfo {
    std::uint32_t width = 0;  // pixels
    std::uint32_t height = 0; // pixels
    std::uint32_t depth = 0;  // bits per pixel
    std::uint32_t colors = 0; // palette size, 0 for non-indexed images
};

/**
 * @brief Reads the header of an in-memory image.
 *
 * Only the header is decoded. Supported types are image/jpeg (and the
 * common image/jpg alias) through libjpeg and image/png through libpng.
 *
 * @param bytes Image file contents.
 * @param mime_type Declared MIME type of the bytes.
 * @return Dimensions and colour information.
 * @throws TagError (PictureEncode) for unsupported MIME types or bytes the
 * decoder rejects.
 */
ImageInfo read_image_info(std::span<const unsigned char> bytes, std::string_view mime_type);

/// @return true if read_image_info() knows how to read this MIME type.
bool is_supported_image_mime(std::string_view mime_type) noexcept;

} // namespace tagmerge

#endif // TAGMERGE_IMAGE_INFO_HPP
