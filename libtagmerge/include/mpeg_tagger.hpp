//
// Created by Giuseppe Francione on 19/10/26.
//

/**
 * @file mpeg_tagger.hpp
 * @brief Defines the ITagger implementation for ID3v2 tags on MP3 files.
 */

#ifndef TAGMERGE_MPEG_TAGGER_HPP
#define TAGMERGE_MPEG_TAGGER_HPP

#include "tagger.hpp"
#include "tagger_options.hpp"
#include "cover_reference.hpp"
#include <memory>

namespace TagLib {
namespace MPEG { class File; }
namespace ID3v2 { class Tag; }
}

namespace tagmerge {

/**
 * @brief Implements ITagger for MP3 files using TagLib's ID3v2 support.
 *
 * The constructor opens the file and keeps it open for the lifetime of the
 * session; an empty ID3v2 tag is created in memory when the file has none.
 * finalize() writes the ID3v2 tag back in place and closes the file.
 *
 * Presence rules: title and album are considered present when their text
 * value is non-empty; artist (TPE1) and comment (COMM) are present as soon
 * as one such frame exists, whatever its content.
 */
class MpegTagger final : public ITagger {
public:
    /**
     * @brief Opens a session on an MP3 file.
     * @param path Path to the MP3 file.
     * @param options Writer settings (ID3v2 version).
     * @throws TagError (Io) if the file is missing or cannot be opened,
     * (TagParse) if TagLib rejects its tag data.
     */
    explicit MpegTagger(std::filesystem::path path, const TaggerOptions& options = {});
    ~MpegTagger() override;

    MpegTagger(const MpegTagger&) = delete;
    MpegTagger& operator=(const MpegTagger&) = delete;

    // --- self-description ---
    [[nodiscard]] AudioFormat format() const noexcept override { return AudioFormat::Mp3; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept override { return path_; }

    // --- cover art ---
    void set_cover(std::span<const unsigned char> data, std::string_view mime_type) override;
    void set_cover_url(std::string_view url) override;

    // --- text fields ---
    void set_title(std::string_view title) override;
    void set_album(std::string_view album) override;

    /**
     * @brief Writes a single TPE1 frame holding one value per artist.
     */
    void set_artist(const std::vector<std::string>& artists) override;

    /**
     * @brief Adds a COMM frame (language "XXX", empty description,
     * ISO-8859-1 encoding) when the tag has no comment frame.
     */
    void set_comment(std::string_view comment) override;

    /**
     * @brief Saves the ID3v2 tag (other tags are left untouched) and
     * releases the file.
     *
     * The file is released even when saving fails; the save failure is
     * then reported.
     * @throws TagError (Io) if TagLib could not write the tag.
     * @throws std::logic_error if the session was already finalized.
     */
    void finalize() override;

private:
    void add_picture(const CoverPicture& cover);
    TagLib::ID3v2::Tag& tag();

    std::filesystem::path path_;
    TaggerOptions options_;
    std::unique_ptr<TagLib::MPEG::File> file_;
    TagLib::ID3v2::Tag* tag_ = nullptr; ///< Owned by file_.
};

} // namespace tagmerge

#endif // TAGMERGE_MPEG_TAGGER_HPP
