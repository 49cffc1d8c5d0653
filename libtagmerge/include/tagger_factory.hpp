//
// Created by Giuseppe Francione on 19/10/26.
//

/**
 * @file tagger_factory.hpp
 * @brief Maps a format name to the matching ITagger implementation.
 */

#ifndef TAGMERGE_TAGGER_FACTORY_HPP
#define TAGMERGE_TAGGER_FACTORY_HPP

#include "tagger.hpp"
#include "tagger_options.hpp"
#include <filesystem>
#include <memory>
#include <string_view>

namespace tagmerge {

/**
 * @brief Opens a tagging session for a file.
 *
 * "mp3" selects MpegTagger and "flac" selects FlacTagger; the name is
 * compared case-insensitively. The chosen constructor loads the file.
 *
 * @param path File to tag.
 * @param format_name Container name chosen by the caller.
 * @param options Writer settings forwarded to the tagger.
 * @return The open session.
 * @throws UnsupportedFormatError for any other name, before touching the file.
 * @throws TagError from the tagger constructor.
 */
std::unique_ptr<ITagger> make_tagger(const std::filesystem::path& path,
                                     std::string_view format_name,
                                     const TaggerOptions& options = {});

/**
 * @brief Same as make_tagger() with an already resolved format.
 */
std::unique_ptr<ITagger> make_tagger(const std::filesystem::path& path,
                                     AudioFormat format,
                                     const TaggerOptions& options = {});

} // namespace tagmerge

#endif // TAGMERGE_TAGGER_FACTORY_HPP
