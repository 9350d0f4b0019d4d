#include "report_generator.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string fixed2(const double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

Result make_result(const inkpress::ProcessResult& processed) {
    Result r;
    r.input = processed.input;
    r.output = processed.output;
    r.size_before = processed.input_size;
    r.size_after = processed.output_size;
    r.success = true;
    r.seconds = static_cast<double>(processed.duration.count()) / 1000.0;
    r.spine_entries_removed = processed.spine_entries_removed;
    r.images_removed = processed.images_removed;
    r.markup_files_rewritten = processed.markup_files_rewritten;
    r.titles_shortened = processed.titles_shortened;
    r.warnings = processed.warnings;
    return r;
}

Result make_failed_result(const std::filesystem::path& input,
                          const std::filesystem::path& output,
                          const std::string& error_kind,
                          const std::string& error_msg,
                          const double seconds) {
    Result r;
    r.input = input;
    r.output = output;
    r.success = false;
    r.seconds = seconds;
    r.error_kind = error_kind;
    r.error_msg = error_msg;
    return r;
}

void print_console_report(const Result& r) {
    const bool use_colors = is_stderr_a_tty();
    const unsigned width = std::min(get_terminal_width(), 100u);
    const std::string rule(width, '-');

    const std::string outcome = !r.success
        ? (use_colors ? "\033[1;31mFAIL\033[0m" : "FAIL")
        : r.warnings.empty() ? (use_colors ? "\033[1;32mOK\033[0m" : "OK")
                             : (use_colors ? "\033[1;33mOK (with warnings)\033[0m" : "OK (with warnings)");

    std::cerr << "\n" << rule << "\n"
              << std::left << std::setw(24) << "Input" << r.input.string() << "\n"
              << std::setw(24) << "Output" << r.output.string() << "\n"
              << std::setw(24) << "Result" << outcome << "\n";

    if (r.success) {
        std::cerr << std::setw(24) << "Size (KB)" << (r.size_before / 1024) << " -> " << (r.size_after / 1024) << "\n"
                  << std::setw(24) << "Spine entries removed" << r.spine_entries_removed << "\n"
                  << std::setw(24) << "Images removed" << r.images_removed << "\n"
                  << std::setw(24) << "Documents rewritten" << r.markup_files_rewritten << "\n"
                  << std::setw(24) << "Titles shortened" << r.titles_shortened << "\n";
    } else {
        std::cerr << std::setw(24) << "Error" << r.error_kind << ": " << r.error_msg << "\n";
    }
    std::cerr << std::setw(24) << "Time (s)" << fixed2(r.seconds) << "\n";

    if (!r.warnings.empty()) {
        std::cerr << "\nWarnings (" << r.warnings.size() << "):\n";
        for (const auto& w : r.warnings) {
            std::cerr << "  [" << inkpress::warning_kind_to_string(w.kind) << "] " << w.message;
            if (!w.path.empty()) std::cerr << " (" << w.path.filename().string() << ")";
            std::cerr << "\n";
        }
    }
    std::cerr << rule << std::endl;
}

bool export_csv_report(const Result& r, const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Input,Output,Before(KB),After(KB),Time(s),Result,SpineRemoved,ImagesRemoved,MarkupRewritten,TitlesShortened,Warnings,Error\n";
    out << csv_escape(r.input.filename().string()) << ","
        << csv_escape(r.output.filename().string()) << ","
        << (r.size_before / 1024) << ","
        << (r.size_after / 1024) << ","
        << fixed2(r.seconds) << ","
        << (r.success ? "OK" : "FAIL") << ","
        << r.spine_entries_removed << ","
        << r.images_removed << ","
        << r.markup_files_rewritten << ","
        << r.titles_shortened << ","
        << r.warnings.size() << ","
        << csv_escape(r.success ? "" : r.error_kind + ": " + r.error_msg) << "\n";

    if (!r.warnings.empty()) {
        out << "\n\nWarning,Message,Path\n";
        for (const auto& w : r.warnings) {
            out << inkpress::warning_kind_to_string(w.kind) << ","
                << csv_escape(w.message) << ","
                << csv_escape(w.path.string()) << "\n";
        }
    }
    return static_cast<bool>(out);
}
