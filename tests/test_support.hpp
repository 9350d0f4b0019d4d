#ifndef INKPRESS_TEST_SUPPORT_HPP
#define INKPRESS_TEST_SUPPORT_HPP

#include "../libinkpress/include/file_utils.hpp"
#include "../libinkpress/include/log_sink.hpp"
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace inkpress::test {

namespace fs = std::filesystem;

/// Writes a file, creating missing parent directories.
void write_text(const fs::path& path, std::string_view content);

std::string read_text(const fs::path& path);

/// Deterministic lowercase words that deflate poorly.
std::string filler_text(std::size_t length, unsigned seed);

/// Fake JPEG payload of the given size.
std::string fake_jpeg(std::size_t size, unsigned seed);

/// Titles of the five navigation entries of the sample book, in spine order.
std::vector<std::string> default_titles();

struct SampleOptions {
    std::vector<std::string> titles = default_titles();
    bool with_mimetype = true;
    bool with_container_xml = true;
    bool with_ncx = true;
    bool with_nav = true;
    bool with_spine = true;
    std::string ncx_override; ///< replaces the generated toc.ncx when non-empty
};

/**
 * @brief Writes an unpacked EPUB: cover page, index page and three articles
 * under OEBPS/, plus images/cover.jpg and images/photo.jpg.
 * @return Path of OEBPS/content.opf.
 */
fs::path write_sample_book(const fs::path& root, const SampleOptions& options = {});

/// Writes the sample book into @p work and packs it as @p epub_path.
fs::path make_sample_epub(const fs::path& work, const fs::path& epub_path, const SampleOptions& options = {});

/// Temporary directory removed at the end of a test.
class TestDir {
public:
    TestDir() : dir_("inkpress_tests", "test") {}
    [[nodiscard]] const fs::path& path() const noexcept { return dir_.path(); }
    fs::path operator/(const fs::path& rel) const { return dir_.path() / rel; }

private:
    ScopedTempDir dir_;
};

/// Log sink keeping every message, for assertions on log output.
class CapturingLogSink final : public ILogSink {
public:
    struct Line {
        LogLevel level;
        std::string message;
        std::string tag;
    };

    explicit CapturingLogSink(std::vector<Line>& lines) : lines_(lines) {}

    void log(LogLevel level, std::string_view message, std::string_view tag) override {
        std::lock_guard lock(mtx_);
        lines_.push_back({level, std::string(message), std::string(tag)});
    }

private:
    std::vector<Line>& lines_;
    std::mutex mtx_;
};

} // namespace inkpress::test

#endif // INKPRESS_TEST_SUPPORT_HPP
