#ifndef INKPRESS_FILE_LOG_SINK_HPP
#define INKPRESS_FILE_LOG_SINK_HPP

#include "../../../libinkpress/include/log_sink.hpp"
#include "../../../libinkpress/include/logger.hpp"
#include "../../../libinkpress/include/diagnostics.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

/**
 * @brief Appends every message, any level, to a log file with a UTC timestamp.
 */
class FileLogSink final : public inkpress::ILogSink {
public:
    /// @throws std::runtime_error if the file can't be opened.
    FileLogSink(const std::filesystem::path& path, const bool append)
        : out_(path, append ? std::ios::app : std::ios::trunc) {
        if (!out_) {
            throw std::runtime_error("Cannot open log file: " + path.string());
        }
    }

    void log(const inkpress::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        out_ << inkpress::format_utc(std::chrono::system_clock::now())
             << " [" << inkpress::Logger::level_to_string(level) << "][" << tag << "] "
             << message << '\n';
        out_.flush();
    }

private:
    std::ofstream out_;
};

#endif // INKPRESS_FILE_LOG_SINK_HPP
