//
// Created by Giuseppe Francione on 19/10/26.
//

#include <iostream>
#include <filesystem>
#include <memory>
#include <string>
#include "cli/cli_parser.hpp"
#include <CLI/CLI.hpp>
#include "../../libtagmerge/include/audio_format.hpp"
#include "../../libtagmerge/include/file_utils.hpp"
#include "../../libtagmerge/include/logger.hpp"
#include "../../libtagmerge/include/tag_error.hpp"
#include "../../libtagmerge/include/tagger_factory.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"

using namespace tagmerge;
namespace fs = std::filesystem;

namespace {

void install_log_sinks(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, true);
        if (!fileSink->is_open()) {
            std::cerr << "Warning: cannot open log file " << settings.log_file.string() << std::endl;
        } else {
            Logger::add_sink(std::move(fileSink));
        }
    }

    const auto level = Logger::string_to_level(settings.log_level);
    if (!settings.quiet && level) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = *level;
        Logger::add_sink(std::move(consoleSink));
    }
}

// explicit --format wins, otherwise the extension decides
std::unique_ptr<ITagger> open_session(const Settings& settings) {
    if (!settings.format.empty()) {
        return make_tagger(settings.input, settings.format, settings.tagger_options());
    }
    const auto format = audio_format_from_path(settings.input);
    if (!format) {
        throw UnsupportedFormatError(settings.input.extension().string());
    }
    return make_tagger(settings.input, *format, settings.tagger_options());
}

void apply_fields(ITagger& tagger, const Settings& settings) {
    if (settings.title) {
        tagger.set_title(*settings.title);
    }
    if (settings.album) {
        tagger.set_album(*settings.album);
    }
    if (!settings.artists.empty()) {
        tagger.set_artist(settings.artists);
    }
    if (settings.comment) {
        tagger.set_comment(*settings.comment);
    }
    if (!settings.cover_path.empty()) {
        const std::string mime = cover_mime_for(settings.cover_path, settings.cover_mime);
        const auto bytes = read_file_bytes(settings.cover_path);
        tagger.set_cover(bytes, mime);
    }
    if (settings.cover_url) {
        tagger.set_cover_url(*settings.cover_url);
    }
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"tagmerge: fill missing tags and cover art in MP3 and FLAC files."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << "Parse error: " << e.what() << std::endl;
        return app.exit(e);
    }

    install_log_sinks(settings);

    try {
        const auto tagger = open_session(settings);
        apply_fields(*tagger, settings);
        tagger->finalize();
    } catch (const TagError& e) {
        Logger::log(LogLevel::Error,
                    settings.input.filename().string() + " " + std::string(to_string(e.kind())) + ": " + e.what(),
                    "main");
        if (settings.quiet || !Logger::string_to_level(settings.log_level)) {
            std::cerr << std::string(to_string(e.kind())) << ": " << e.what() << std::endl;
        }
        return 1;
    }

    Logger::log(LogLevel::Info, "Tagged " + settings.input.string(), "main");
    return 0;
}
