//
// Created by Giuseppe Francione on 19/10/26.
//

/**
 * @file tag_error.hpp
 * @brief Exception types thrown by the taggers and the dispatcher.
 */

#ifndef TAGMERGE_TAG_ERROR_HPP
#define TAGMERGE_TAG_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace tagmerge {

/**
 * @brief Classifies every failure a tagging session can report.
 */
enum class ErrorKind {
    TagParse,          ///< Malformed existing tag / metadata block data
    UnsupportedFormat, ///< Unknown format name at dispatch time
    Io,                ///< Read or write failure while loading or finalizing
    PictureEncode      ///< Cover bytes or MIME type cannot form a picture entry
};

/// @return Stable name of the kind, used in messages and logs.
constexpr std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::TagParse:          return "TagParseError";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::Io:                return "IoError";
        case ErrorKind::PictureEncode:     return "PictureEncodeError";
    }
    return "UnknownError";
}

/**
 * @brief Base exception of the library.
 *
 * what() carries the human-readable detail, kind() the category callers
 * branch on.
 */
class TagError : public std::runtime_error {
public:
    TagError(const ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Thrown by the dispatcher when no tagger handles a format name.
 */
class UnsupportedFormatError final : public TagError {
public:
    explicit UnsupportedFormatError(std::string format_name)
        : TagError(ErrorKind::UnsupportedFormat,
                   "format: " + format_name + " is not supported"),
          format_name_(std::move(format_name)) {}

    /// @return The offending name, exactly as the caller passed it.
    [[nodiscard]] const std::string& format_name() const noexcept { return format_name_; }

private:
    std::string format_name_;
};

} // namespace tagmerge

#endif // TAGMERGE_TAG_ERROR_HPP
