//
// Created by Giuseppe Francione on 19/10/26.
//

#include "cli_parser.hpp"
#include "../../../libtagmerge/include/audio_format.hpp"
#include <CLI/CLI.hpp>

namespace {
// helper for validating the container format string
struct AudioFormatValidator : CLI::Validator {
    AudioFormatValidator() {
        name_ = "AudioFormat";
        func_ = [](const std::string& str) {
            if (!tagmerge::parse_audio_format(str).has_value()) {
                return std::string("Invalid format: '") + str + "'. Must be one of: mp3, flac.";
            }
            return std::string(); // ok
        };
    }
};
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    app.add_option("input", settings.input, "Audio file to tag in place.")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("-f,--format", settings.format,
                   "Tag container: mp3 or flac (default: from the file extension).")
        ->check(AudioFormatValidator());

    // --- text fields (written only when missing) ---
    app.add_option("-t,--title", settings.title, "Title to write if the file has none.");
    app.add_option("-a,--album", settings.album, "Album to write if the file has none.");
    app.add_option("-A,--artist", settings.artists,
                   "Artist to write if the file has none (repeat for several, order is kept).");
    app.add_option("-c,--comment", settings.comment,
                   "Comment to write if the file has none (ignored for FLAC).");

    // --- cover art (always appended) ---
    auto* cover = app.add_option("--cover", settings.cover_path, "Image file to embed as front cover.")
        ->check(CLI::ExistingFile);
    app.add_option("--cover-mime", settings.cover_mime,
                   "MIME type of --cover (default: from its extension).")
        ->needs(cover);
    app.add_option("--cover-url", settings.cover_url,
                   "Reference an external front cover by URL.");

    // --- writer settings ---
    app.add_option("--id3v2-version", settings.id3v2_version, "ID3v2 version written to MP3 files.")
        ->default_val(4)
        ->check(CLI::IsMember({3, 4}));

    app.add_flag("--replace-comment-block", settings.replace_comment_block,
                 "FLAC: drop the existing VORBIS_COMMENT block instead of keeping it next to the new one.");

    app.add_flag("--no-padding", settings.no_padding,
                 "FLAC: always rewrite the whole file instead of reusing PADDING.");

    app.add_flag("--preserve-file-stats", settings.preserve_file_stats,
                 "FLAC: keep modification time and permissions.");

    // --- logging ---
    app.add_flag("-q,--quiet", settings.quiet, "Suppress console log output.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Append logs to a file (default: no file logging).");
}
