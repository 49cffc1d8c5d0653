//
// Created by Giuseppe Francione on 19/10/26.
//

#include "../../include/tagger_factory.hpp"
#include "../../include/flac_tagger.hpp"
#include "../../include/logger.hpp"
#include "../../include/mpeg_tagger.hpp"
#include "../../include/tag_error.hpp"
#include <string>

namespace tagmerge {

std::unique_ptr<ITagger> make_tagger(const std::filesystem::path& path,
                                     const AudioFormat format,
                                     const TaggerOptions& options) {
    switch (format) {
        case AudioFormat::Mp3:
            return std::make_unique<MpegTagger>(path, options);
        case AudioFormat::Flac:
            return std::make_unique<FlacTagger>(path, options);
    }
    throw UnsupportedFormatError(std::string(audio_format_to_string(format)));
}

std::unique_ptr<ITagger> make_tagger(const std::filesystem::path& path,
                                     const std::string_view format_name,
                                     const TaggerOptions& options) {
    const auto format = parse_audio_format(format_name);
    if (!format) {
        Logger::log(LogLevel::Error, "format: " + std::string(format_name) + " is not supported", "tagger_factory");
        throw UnsupportedFormatError(std::string(format_name));
    }
    return make_tagger(path, *format, options);
}

} // namespace tagmerge
