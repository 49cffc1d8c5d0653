//
// Created by Giuseppe Francione on 19/10/26.
//

#include "../../include/audio_format.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace tagmerge {

namespace {

bool iequals(const std::string_view s1, const std::string_view s2) {
    return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

} // namespace

std::optional<AudioFormat> parse_audio_format(const std::string_view name) {
    if (iequals(name, "mp3")) return AudioFormat::Mp3;
    if (iequals(name, "flac")) return AudioFormat::Flac;
    return std::nullopt;
}

std::optional<AudioFormat> audio_format_from_path(const std::filesystem::path& path) {
    const std::string ext = path.extension().string();
    if (ext.size() < 2 || ext[0] != '.') {
        return std::nullopt;
    }
    return parse_audio_format(std::string_view(ext).substr(1));
}

std::string_view audio_format_to_string(const AudioFormat format) noexcept {
    switch (format) {
        case AudioFormat::Mp3:  return "mp3";
        case AudioFormat::Flac: return "flac";
    }
    return "unknown";
}

} // namespace tagmerge
