//
// Created by Giuseppe Francione on 19/10/26.
//

#include "../../include/cover_reference.hpp"

namespace tagmerge {

CoverPicture make_embedded_cover(const std::span<const unsigned char> bytes, const std::string_view mime_type) {
    CoverPicture cover;
    cover.data.assign(bytes.begin(), bytes.end());
    cover.mime_type = std::string(mime_type);
    return cover;
}

CoverPicture make_url_cover(const std::string_view url) {
    CoverPicture cover;
    cover.data.assign(url.begin(), url.end());
    cover.mime_type = std::string(kUrlMimeSentinel);
    return cover;
}

bool is_url_reference(const CoverPicture& cover) noexcept {
    return cover.mime_type == kUrlMimeSentinel;
}

std::optional<std::string> cover_url(const CoverPicture& cover) {
    if (!is_url_reference(cover)) {
        return std::nullopt;
    }
    return std::string(cover.data.begin(), cover.data.end());
}

} // namespace tagmerge
