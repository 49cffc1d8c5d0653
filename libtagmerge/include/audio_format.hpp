//
// Created by Giuseppe Francione on 19/10/26.
//

/**
 * @file audio_format.hpp
 * @brief Enumeration of the tag containers tagmerge can write.
 */

#ifndef TAGMERGE_AUDIO_FORMAT_HPP
#define TAGMERGE_AUDIO_FORMAT_HPP

#include <filesystem>
#include <optional>
#include <string_view>

namespace tagmerge {

enum class AudioFormat {
    Mp3,  ///< ID3v2 frames prepended to an MPEG audio stream
    Flac  ///< FLAC metadata block chain
};

/**
 * @brief Parses a format name ("mp3", "flac"), ignoring case.
 * @return The format, or std::nullopt for anything else.
 */
std::optional<AudioFormat> parse_audio_format(std::string_view name);

/**
 * @brief Guesses the format from a file extension (".mp3", ".FLAC", ...).
 */
std::optional<AudioFormat> audio_format_from_path(const std::filesystem::path& path);

/// @return Canonical lower-case name of the format.
std::string_view audio_format_to_string(AudioFormat format) noexcept;

} // namespace tagmerge

#endif // TAGMERGE_AUDIO_FORMAT_HPP
