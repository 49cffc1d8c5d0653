//
// Created by Giuseppe Francione on 19/10/26.
//

/**
 * @file flac_tagger.hpp
 * @brief Defines the ITagger implementation for FLAC metadata block chains.
 */

#ifndef TAGMERGE_FLAC_TAGGER_HPP
#define TAGMERGE_FLAC_TAGGER_HPP

#include "tagger.hpp"
#include "tagger_options.hpp"
#include "cover_reference.hpp"
#include "image_info.hpp"
#include "vorbis_comment.hpp"
#include <FLAC/metadata.h>
#include <memory>

namespace tagmerge {

/**
 * @brief Implements ITagger for FLAC files using libFLAC's metadata chain.
 *
 * The whole metadata block chain is read at construction. The first
 * VORBIS_COMMENT block, if any, is copied into a VorbisComment map which
 * the text setters update; covers are appended to the chain as new
 * PICTURE blocks. finalize() appends a copy of the loaded VORBIS_COMMENT
 * block extended with the new entries and rewrites the file. Loaded
 * entries are written back unchanged, valid UTF-8 or not.
 *
 * Unless TaggerOptions::replace_comment_block is set, the VORBIS_COMMENT
 * block read at load time stays in the chain, so a file that already had
 * one ends up with two.
 */
class FlacTagger final : public ITagger {
public:
    /**
     * @brief Opens a session on a FLAC file.
     * @param path Path to the FLAC file.
     * @param options Writer settings (padding, file stats, comment block policy).
     * @throws TagError (Io) if the file cannot be read, (TagParse) if it is
     * not a FLAC stream or its metadata is corrupt.
     */
    explicit FlacTagger(std::filesystem::path path, const TaggerOptions& options = {});
    ~FlacTagger() override;

    FlacTagger(const FlacTagger&) = delete;
    FlacTagger& operator=(const FlacTagger&) = delete;

    // --- self-description ---
    [[nodiscard]] AudioFormat format() const noexcept override { return AudioFormat::Flac; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept override { return path_; }

    // --- cover art ---

    /**
     * @brief Appends a PICTURE block with the image bytes.
     *
     * The image header is read to fill width, height and colour depth.
     * @throws TagError (PictureEncode) for unsupported MIME types or
     * undecodable image data; the session stays usable.
     */
    void set_cover(std::span<const unsigned char> data, std::string_view mime_type) override;
    void set_cover_url(std::string_view url) override;

    // --- text fields ---
    // values must be valid UTF-8, otherwise TagError (TagParse) is thrown
    // and the field stays unset
    void set_title(std::string_view title) override;
    void set_album(std::string_view album) override;
    void set_artist(const std::vector<std::string>& artists) override;

    /**
     * @brief Accepted and ignored: FLAC comments are not written.
     */
    void set_comment(std::string_view comment) override;

    /**
     * @brief Appends the rebuilt VORBIS_COMMENT block and rewrites the file.
     * @throws TagError (Io) with libFLAC's status if the write fails.
     * @throws std::logic_error if the session was already finalized.
     */
    void finalize() override;

    /// @return The in-memory comment map (for inspection).
    [[nodiscard]] const VorbisComment& comments() const noexcept { return comments_; }

private:
    struct ChainDeleter {
        void operator()(FLAC__Metadata_Chain* chain) const {
            if (chain) FLAC__metadata_chain_delete(chain);
        }
    };

    void add_picture(const CoverPicture& cover, const ImageInfo& info);
    void append_block(MetadataPtr block);
    void remove_loaded_comment_block();
    FLAC__Metadata_Chain* chain();

    std::filesystem::path path_;
    TaggerOptions options_;
    std::unique_ptr<FLAC__Metadata_Chain, ChainDeleter> chain_;
    VorbisComment comments_;
    bool had_comment_block_ = false;
};

} // namespace tagmerge

#endif // TAGMERGE_FLAC_TAGGER_HPP
