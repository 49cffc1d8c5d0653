//
// Created by Giuseppe Francione on 19/10/26.
//

#ifndef TAGMERGE_TAGGER_OPTIONS_HPP
#define TAGMERGE_TAGGER_OPTIONS_HPP

namespace tagmerge {

/**
 * @brief Knobs shared by all taggers. Defaults reproduce the plain
 * fill-if-absent behaviour.
 */
struct TaggerOptions {
    /// ID3v2 major version written by the MP3 tagger (3 or 4).
    int id3v2_version = 4;

    /// Let libFLAC absorb metadata size changes into PADDING blocks.
    bool flac_use_padding = true;

    /// Keep modification time and permissions when rewriting a FLAC file.
    bool flac_preserve_file_stats = false;

    /**
     * Drop the VORBIS_COMMENT block read at load time when the FLAC tagger
     * appends the rebuilt one. Off by default: the chain then keeps both.
     */
    bool replace_comment_block = false;
};

} // namespace tagmerge

#endif // TAGMERGE_TAGGER_OPTIONS_HPP
