//
// Created by Giuseppe Francione on 19/10/26.
//

#ifndef TAGMERGE_LOG_SINK_HPP
#define TAGMERGE_LOG_SINK_HPP

#include <string_view>

namespace tagmerge {

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use them to filter or format output.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (frame and block details)
    Info,    ///< Normal operation (session opened, fields written)
    Warning, ///< Unexpected but tolerated states
    Error    ///< Failures reported to the caller
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define where log messages go
 * (console, file, test capture). The Logger fans messages out
 * to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace tagmerge

#endif // TAGMERGE_LOG_SINK_HPP
