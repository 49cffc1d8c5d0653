//
// Created by Giuseppe Francione on 19/10/26.
//

/**
 * @file cover_reference.hpp
 * @brief Container-neutral description of a cover picture.
 */

#ifndef TAGMERGE_COVER_REFERENCE_HPP
#define TAGMERGE_COVER_REFERENCE_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tagmerge {

/// MIME literal marking a picture payload as a URL instead of image bytes.
inline constexpr std::string_view kUrlMimeSentinel = "-->";

/// Description written on every cover entry.
inline constexpr std::string_view kFrontCoverDescription = "Front cover";

/// ID3v2 APIC / FLAC PICTURE type for the front cover.
inline constexpr int kFrontCoverPictureType = 3;

/**
 * @brief Neutral cover art entry handed to the container-specific taggers.
 *
 * Either an embedded image (data holds image bytes, mime_type a real image
 * MIME type) or an external reference (data holds the URL bytes, mime_type
 * is kUrlMimeSentinel).
 */
struct CoverPicture {
    std::vector<unsigned char> data;
    std::string mime_type;
    std::string description{kFrontCoverDescription};
    int picture_type = kFrontCoverPictureType;
};

/**
 * @brief Builds an embedded front cover from raw image bytes.
 * @param bytes Image file contents.
 * @param mime_type Genuine image MIME type (e.g. "image/jpeg").
 */
CoverPicture make_embedded_cover(std::span<const unsigned char> bytes, std::string_view mime_type);

/**
 * @brief Builds a front cover that references an external image by URL.
 *
 * The URL is stored verbatim as the payload and the MIME type is set to
 * kUrlMimeSentinel.
 */
CoverPicture make_url_cover(std::string_view url);

/// @return true if the entry uses the URL sentinel.
bool is_url_reference(const CoverPicture& cover) noexcept;

/**
 * @brief Decodes a sentinel entry back to its URL.
 * @return The literal URL, or std::nullopt for embedded images.
 */
std::optional<std::string> cover_url(const CoverPicture& cover);

} // namespace tagmerge

#endif // TAGMERGE_COVER_REFERENCE_HPP
