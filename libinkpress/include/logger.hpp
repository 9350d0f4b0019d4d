/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Every component of the library logs through Logger, which forwards
 * each message to the registered ILogSink implementations. Without
 * sinks, messages are dropped.
 */

#ifndef INKPRESS_LOGGER_HPP
#define INKPRESS_LOGGER_HPP

#include "log_sink.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace inkpress {

/**
 * @brief Static logging facade for inkpress.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove and destroy one sink previously passed to add_sink().
     * Unknown pointers are ignored.
     */
    static void remove_sink(const ILogSink* sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    static std::size_t sink_count();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "inkpress").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "inkpress");

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
     * @brief Converts a string to its LogLevel enum representation.
     * Case-sensitive. Returns LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING")
            return LogLevel::Warning;
        return LogLevel::Error;
    }
private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

} // namespace inkpress

#endif // INKPRESS_LOGGER_HPP
