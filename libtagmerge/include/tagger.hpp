//
// Created by Giuseppe Francione on 19/10/26.
//

#ifndef TAGMERGE_TAGGER_HPP
#define TAGMERGE_TAGGER_HPP

#include "audio_format.hpp"
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @namespace tagmerge
 * @brief The main namespace for the tagmerge library.
 *
 * @details tagmerge fills missing descriptive metadata (title, album,
 * artists, comment, cover art) into audio files without ever replacing
 * what is already there. It holds the abstract ITagger interface, the
 * ID3v2 and FLAC implementations, the format dispatcher and the
 * logging facade.
 */
namespace tagmerge {

/**
 * @brief Interface of a tagging session bound to one audio file.
 *
 * A session is opened by a concrete tagger's constructor, which loads the
 * existing tag data eagerly. Setters only mutate in-memory state; nothing
 * reaches the disk until finalize(), which must be called exactly once.
 *
 * Title, album, artist and comment follow a fill-if-absent policy: when
 * the loaded tag already has the field, the setter does nothing. Cover
 * setters always append a new front-cover picture.
 *
 * All operations throw TagError on failure. A session is not safe for
 * concurrent use, and two sessions must not target the same path.
 */
class ITagger {
public:
    virtual ~ITagger() = default;

    // --- self-description ---

    /// @return Container format handled by this session.
    [[nodiscard]] virtual AudioFormat format() const noexcept = 0;

    /// @return Path of the file this session will rewrite.
    [[nodiscard]] virtual const std::filesystem::path& path() const noexcept = 0;

    // --- cover art ---

    /**
     * @brief Append an embedded front cover.
     * @param data Raw image bytes.
     * @param mime_type Genuine image MIME type (e.g. "image/png").
     * @throws TagError (PictureEncode) if the container cannot represent the picture.
     */
    virtual void set_cover(std::span<const unsigned char> data, std::string_view mime_type) = 0;

    /**
     * @brief Append a front cover that references an external image.
     *
     * The URL becomes the picture payload and the MIME type is the "-->"
     * sentinel.
     */
    virtual void set_cover_url(std::string_view url) = 0;

    // --- text fields (fill-if-absent) ---

    virtual void set_title(std::string_view title) = 0;
    virtual void set_album(std::string_view album) = 0;

    /**
     * @brief Write the artists if the file has none.
     * @param artists One entry per artist, stored in the given order.
     */
    virtual void set_artist(const std::vector<std::string>& artists) = 0;

    /**
     * @brief Write a comment if the file has none.
     *
     * Containers without a modelled comment field accept and discard it.
     */
    virtual void set_comment(std::string_view comment) = 0;

    // --- persistence ---

    /**
     * @brief Write the accumulated state back to path().
     * @throws TagError (Io) if the file cannot be rewritten.
     */
    virtual void finalize() = 0;
};

} // namespace tagmerge

#endif // TAGMERGE_TAGGER_HPP
