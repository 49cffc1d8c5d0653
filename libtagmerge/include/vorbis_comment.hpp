//
// Created by Giuseppe Francione on 19/10/26.
//

/**
 * @file vorbis_comment.hpp
 * @brief Mutable model of a FLAC VORBIS_COMMENT metadata block.
 */

#ifndef TAGMERGE_VORBIS_COMMENT_HPP
#define TAGMERGE_VORBIS_COMMENT_HPP

#include <FLAC/metadata.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tagmerge {

/// Releases a libFLAC metadata object.
struct MetadataDeleter {
    void operator()(FLAC__StreamMetadata* block) const {
        if (block) FLAC__metadata_object_delete(block);
    }
};
using MetadataPtr = std::unique_ptr<FLAC__StreamMetadata, MetadataDeleter>;

///< Standard field names written by the FLAC tagger.
inline constexpr std::string_view kFieldTitle = "TITLE";
inline constexpr std::string_view kFieldAlbum = "ALBUM";
inline constexpr std::string_view kFieldArtist = "ARTIST";

/**
 * @brief Ordered key/value comment map backed by raw "NAME=value" entries.
 *
 * A map read from a file keeps a copy of its block: to_block() clones it and
 * appends only the entries added since, so loaded entries are written back
 * byte for byte even when they are not valid UTF-8. Field names compare
 * case-insensitively, as the Vorbis comment format requires.
 */
class VorbisComment {
public:
    /// Empty map carrying libFLAC's vendor string.
    VorbisComment();
    explicit VorbisComment(std::string vendor);

    /**
     * @brief Copies the content of a VORBIS_COMMENT block.
     * @throws TagError (TagParse) if the block is of another type.
     * @throws std::bad_alloc if libFLAC cannot copy the block.
     */
    static VorbisComment from_block(const FLAC__StreamMetadata& block);

    /**
     * @brief All values stored under a field name, in entry order.
     * @throws TagError (TagParse) if an entry has no '=' separator.
     */
    [[nodiscard]] std::vector<std::string> get(std::string_view name) const;

    /// @return true if at least one value is stored under name.
    [[nodiscard]] bool has(std::string_view name) const { return !get(name).empty(); }

    /**
     * @brief Checks that name/value form a legal comment entry.
     * @throws TagError (TagParse) for an illegal field name or a value that
     * is not valid UTF-8.
     */
    static void check_entry(std::string_view name, std::string_view value);

    /**
     * @brief Appends a "NAME=value" entry.
     * @throws TagError (TagParse) as check_entry(); the map is left unchanged.
     */
    void add(std::string_view name, std::string_view value);

    [[nodiscard]] const std::string& vendor() const noexcept { return vendor_; }

    /// Loaded entries first, then the added ones.
    [[nodiscard]] const std::vector<std::string>& entries() const noexcept { return entries_; }

    /// @return Number of entries appended with add().
    [[nodiscard]] std::size_t added_count() const noexcept { return entries_.size() - loaded_count_; }

    /**
     * @brief Serializes the map into a new VORBIS_COMMENT block.
     * @throws std::bad_alloc if libFLAC cannot allocate the block.
     * @throws TagError (TagParse) if a vendor string given to the
     * constructor is not valid UTF-8.
     */
    [[nodiscard]] MetadataPtr to_block() const;

private:
    std::string vendor_;
    std::vector<std::string> entries_;
    MetadataPtr loaded_;            ///< Copy of the block the map was read from.
    std::size_t loaded_count_ = 0;  ///< Leading entries_ that came from loaded_.
};

} // namespace tagmerge

#endif // TAGMERGE_VORBIS_COMMENT_HPP
