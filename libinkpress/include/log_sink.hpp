#ifndef INKPRESS_LOG_SINK_HPP
#define INKPRESS_LOG_SINK_HPP

#include <string_view>

namespace inkpress {

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use them to filter or format output.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (title rewrites, removed files)
    Info,    ///< Pipeline stages and summaries
    Warning, ///< Non-fatal problems, the pipeline keeps going
    Error    ///< Fatal problems, the run is aborted
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations define where log messages go (console, file, an
 * observer owned by a library caller). The Logger delegates to every
 * installed sink.
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

} // namespace inkpress

#endif // INKPRESS_LOG_SINK_HPP
