//
// Created by Giuseppe Francione on 19/10/26.
//

#ifndef TAGMERGE_CLI_PARSER_HPP
#define TAGMERGE_CLI_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "../../../libtagmerge/include/tagger_options.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::filesystem::path input;
    std::string format;

    std::optional<std::string> title;
    std::optional<std::string> album;
    std::optional<std::string> comment;
    std::vector<std::string> artists;

    std::filesystem::path cover_path;
    std::string cover_mime;
    std::optional<std::string> cover_url;

    int id3v2_version = 4;
    bool replace_comment_block = false;
    bool no_padding = false;
    bool preserve_file_stats = false;

    bool quiet = false;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;

    [[nodiscard]] tagmerge::TaggerOptions tagger_options() const {
        tagmerge::TaggerOptions options;
        options.id3v2_version = id3v2_version;
        options.flac_use_padding = !no_padding;
        options.flac_preserve_file_stats = preserve_file_stats;
        options.replace_comment_block = replace_comment_block;
        return options;
    }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //TAGMERGE_CLI_PARSER_HPP
