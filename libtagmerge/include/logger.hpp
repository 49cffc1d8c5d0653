//
// Created by Giuseppe Francione on 19/10/26.
//

/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade used by every tagger.
 */

#ifndef TAGMERGE_LOGGER_HPP
#define TAGMERGE_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tagmerge {

/**
 * @brief Static logging facade for tagmerge.
 *
 * Delegates log messages to all registered ILogSink implementations.
 * With no sink installed the library is silent.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "tagmerge").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "tagmerge");

    /// @return Number of installed sinks.
    static std::size_t sink_count();

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a CLI level name to a LogLevel.
     * Case-sensitive. "NONE" (or anything unknown) yields std::nullopt,
     * meaning the sink should stay silent.
     * @param level The string value (e.g., "DEBUG", "WARNING").
     */
    static std::optional<LogLevel> string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING")
            return LogLevel::Warning;
        if (level == "ERROR")
            return LogLevel::Error;
        return std::nullopt;
    }
private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

} // namespace tagmerge

#endif //TAGMERGE_LOGGER_HPP
