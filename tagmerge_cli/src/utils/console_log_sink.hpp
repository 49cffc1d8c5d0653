//
// Created by Giuseppe Francione on 19/10/26.
//

#ifndef TAGMERGE_CONSOLE_LOG_SINK_HPP
#define TAGMERGE_CONSOLE_LOG_SINK_HPP

#include "../../../libtagmerge/include/log_sink.hpp"
#include <iostream>

// prints messages at or above log_level; warnings and errors go to stderr
class ConsoleLogSink final : public tagmerge::ILogSink {
public:
    tagmerge::LogLevel log_level = tagmerge::LogLevel::Error;
    void log(const tagmerge::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) {
            return;
        }
        switch (level) {
            case tagmerge::LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case tagmerge::LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case tagmerge::LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case tagmerge::LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // TAGMERGE_CONSOLE_LOG_SINK_HPP
