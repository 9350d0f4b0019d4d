#ifndef INKPRESS_CONSOLE_LOG_SINK_HPP
#define INKPRESS_CONSOLE_LOG_SINK_HPP

#include "../../../libinkpress/include/log_sink.hpp"
#include <iostream>

/**
 * @brief Writes messages at or above log_level to the console.
 * Debug and Info go to stdout, Warning and Error to stderr.
 */
class ConsoleLogSink final : public inkpress::ILogSink {
public:
    inkpress::LogLevel log_level = inkpress::LogLevel::Info;

    void log(const inkpress::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        using inkpress::LogLevel;
        if (level < log_level) return;
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // INKPRESS_CONSOLE_LOG_SINK_HPP
