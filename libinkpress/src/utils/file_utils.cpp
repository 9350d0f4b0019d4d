#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace inkpress {

    std::filesystem::path make_temp_dir_for(const std::filesystem::path& input_path, const std::string& prefix) {
        // use a common base dir inside temp
        const auto base_tmp = std::filesystem::temp_directory_path() /
            ("inkpress-" + prefix);
        std::filesystem::create_directories(base_tmp);

        const std::string stem = input_path.stem().string();
        const std::string dir_name = prefix + "_" + stem + "_" + RandomUtils::random_suffix();
        auto dir = base_tmp / dir_name;

        std::filesystem::create_directories(dir);
        Logger::log(LogLevel::Debug, "Created temp dir: " + dir.string(), "file_utils");
        return dir;
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

    ScopedTempDir::ScopedTempDir(const std::filesystem::path& input_path, const std::string& prefix)
        : path_(make_temp_dir_for(input_path, prefix)) {}

    ScopedTempDir::~ScopedTempDir() {
        if (!path_.empty()) {
            cleanup_temp_dir(path_, "ScopedTempDir");
        }
    }

    ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept
        : path_(std::move(other.path_)) {
        other.path_.clear();
    }

    ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
        if (this != &other) {
            if (!path_.empty()) {
                cleanup_temp_dir(path_, "ScopedTempDir");
            }
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) {
            throw std::runtime_error("Failed to open file for reading: " + path.string());
        }
        std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
        if (ifs.bad()) {
            throw std::runtime_error("Failed to read file: " + path.string());
        }
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::string_view data) {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("Failed to open file for writing: " + path.string());
        }
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.close();
        if (!ofs) {
            throw std::runtime_error("Failed to write file: " + path.string());
        }
    }

    std::string to_lower_copy(const std::string_view s) {
        std::string out(s);
        for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    bool contains_icase(const std::string_view haystack, const std::string_view needle) {
        if (needle.empty()) return true;
        const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                                    [](const char a, const char b) {
                                        return std::tolower(static_cast<unsigned char>(a)) ==
                                               std::tolower(static_cast<unsigned char>(b));
                                    });
        return it != haystack.end();
    }

    std::uintmax_t file_size_or_zero(const std::filesystem::path& path) noexcept {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : size;
    }

} // namespace inkpress
