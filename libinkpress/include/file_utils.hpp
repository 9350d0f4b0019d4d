/**
 * @file file_utils.hpp
 * @brief Filesystem and string helpers shared by the EPUB components.
 */

#ifndef INKPRESS_FILE_UTILS_HPP
#define INKPRESS_FILE_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace inkpress {

    /**
     * @brief Creates a unique temporary directory for processing.
     *
     * Creates a directory inside the system temp path using a
     * "inkpress-{prefix}/{prefix}_{filename_stem}_{random_suffix}" pattern.
     *
     * @param input_path The input file path (used for its stem).
     * @param prefix A short prefix (e.g., "epub").
     * @return Filesystem path to the newly created temporary directory.
     * @throws std::filesystem::filesystem_error if the directory can't be created.
     */
    std::filesystem::path make_temp_dir_for(const std::filesystem::path &input_path,
                                            const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The path to the directory to be removed.
     * @param tag The logger tag.
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

    /**
     * @brief Owns a temporary working directory for the duration of a scope.
     *
     * The directory tree is removed when the object is destroyed, including
     * during stack unwinding. Move-only.
     */
    class ScopedTempDir {
    public:
        ScopedTempDir(const std::filesystem::path& input_path, const std::string& prefix);
        ~ScopedTempDir();

        ScopedTempDir(const ScopedTempDir&) = delete;
        ScopedTempDir& operator=(const ScopedTempDir&) = delete;
        ScopedTempDir(ScopedTempDir&& other) noexcept;
        ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    /// Reads a whole file as bytes. Throws std::runtime_error on failure.
    std::string read_file(const std::filesystem::path& path);

    /// Writes (truncating) a whole file. Throws std::runtime_error on failure.
    void write_file(const std::filesystem::path& path, std::string_view data);

    std::string to_lower_copy(std::string_view s);

    /// ASCII case-insensitive substring test.
    bool contains_icase(std::string_view haystack, std::string_view needle);

    /// Size of a regular file, 0 when it can't be determined.
    std::uintmax_t file_size_or_zero(const std::filesystem::path& path) noexcept;

} // namespace inkpress

#endif // INKPRESS_FILE_UTILS_HPP
