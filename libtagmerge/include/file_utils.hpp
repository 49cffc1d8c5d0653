//
// Created by Giuseppe Francione on 19/10/26.
//

#ifndef TAGMERGE_FILE_UTILS_HPP
#define TAGMERGE_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tagmerge {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory (cover images, test fixtures).
     * @param path The path to the file.
     * @return The file contents.
     * @throws TagError (Io) if the file cannot be opened or read.
     */
    std::vector<unsigned char> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Guesses an image MIME type from a file extension.
     * @return "image/png", "image/jpeg", "image/webp", "image/gif", or an
     * empty string if the extension is not recognised.
     */
    std::string mime_from_extension(const std::filesystem::path &path);

    /**
     * @brief Picks the MIME type of a cover image file.
     * @param path The image file.
     * @param explicit_mime MIME type given by the user; wins when non-empty.
     * @return explicit_mime, or the type guessed by mime_from_extension().
     * @throws TagError (PictureEncode) if no MIME type was given and the
     * extension is not recognised.
     */
    std::string cover_mime_for(const std::filesystem::path &path, std::string_view explicit_mime);
} // namespace tagmerge

#endif // TAGMERGE_FILE_UTILS_HPP
