#include "../../include/epub_container.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <zlib.h>
#include <algorithm>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <memory>
#include <optional>
#include <system_error>

namespace inkpress {

namespace fs = std::filesystem;

static const char* container_tag() {
    return "EpubContainer";
}

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const noexcept { archive_read_free(a); }
};
struct ArchiveWriteDeleter {
    void operator()(archive* a) const noexcept { archive_write_free(a); }
};
struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const noexcept { archive_entry_free(e); }
};

using ArchiveReader = std::unique_ptr<archive, ArchiveReadDeleter>;
using ArchiveWriter = std::unique_ptr<archive, ArchiveWriteDeleter>;
using ArchiveEntryPtr = std::unique_ptr<archive_entry, ArchiveEntryDeleter>;

std::string archive_message(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

void check_plausible_file(const fs::path& input_path, std::uintmax_t& size_out) {
    std::error_code ec;
    if (!fs::is_regular_file(input_path, ec)) {
        throw InvalidInputError("Input file not found", input_path);
    }
    const auto size = fs::file_size(input_path, ec);
    if (ec) {
        throw InvalidInputError("Can't determine input size (" + ec.message() + ")", input_path);
    }
    if (size < kMinEpubSize) {
        throw InvalidInputError("Input file is too small (" + std::to_string(size) +
                                " bytes), possibly empty or corrupt", input_path);
    }
    size_out = size;
}

ArchiveReader open_zip_for_reading(const fs::path& input_path) {
    ArchiveReader in(archive_read_new());
    if (!in) {
        throw ContainerIOError("archive_read_new failed", input_path);
    }
    archive_read_support_format_zip(in.get());
    const int open_r = archive_read_open_filename(in.get(), input_path.string().c_str(), 10240);
    if (open_r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(in.get()), container_tag());
    } else if (open_r != ARCHIVE_OK) {
        throw InvalidInputError("Input file is not a valid ZIP/EPUB (" + archive_message(in.get()) + ")",
                                input_path);
    }
    return in;
}

// sanitize a candidate archive entry path to avoid zip-slip
bool sanitize_entry_path(const std::string& entry_name, const fs::path& dest_dir, fs::path& out_path) {
    if (entry_name.empty()) return false;

    std::string s = entry_name;
    for (auto& c : s) { if (c == '\\') c = '/'; }
    while (!s.empty() && s.front() == '/') s.erase(s.begin());
    if (s.empty()) return false;

    const auto normalized = (dest_dir / fs::path(s).relative_path()).lexically_normal();
    const auto rel = normalized.lexically_relative(dest_dir.lexically_normal());
    if (rel.empty() || *rel.begin() == "..") return false;

    out_path = normalized;
    return true;
}

void write_entry(archive* out, const std::string& name, const std::string& data, const fs::path& output_path) {
    ArchiveEntryPtr entry(archive_entry_new());
    if (!entry) {
        throw ContainerIOError("archive_entry_new failed", output_path);
    }
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);

    const int wh = archive_write_header(out, entry.get());
    if (wh == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(out), container_tag());
    } else if (wh != ARCHIVE_OK) {
        throw ContainerIOError("Failed to write header for " + name + " (" + archive_message(out) + ")",
                               output_path);
    }

    if (!data.empty()) {
        const la_ssize_t wrote = archive_write_data(out, data.data(), data.size());
        if (wrote < 0) {
            throw ContainerIOError("Failed to write data for " + name + " (" + archive_message(out) + ")",
                                   output_path);
        }
    }
    if (archive_write_finish_entry(out) < ARCHIVE_WARN) {
        throw ContainerIOError("Failed to finish entry " + name + " (" + archive_message(out) + ")",
                               output_path);
    }
}

void set_zip_option(archive* out, const char* key, const char* value, const fs::path& output_path) {
    const int r = archive_write_set_format_option(out, "zip", key, value);
    if (r < ARCHIVE_WARN) {
        throw ContainerIOError(std::string("Failed to set zip option ") + key + "=" + value +
                               " (" + archive_message(out) + ")", output_path);
    }
}

// ZIP record layout, APPNOTE 4.3.7 / 4.3.12 / 4.3.16
constexpr std::uint32_t kLocalHeaderSig = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50;
constexpr std::uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr std::uint32_t kZip64LocatorSig = 0x07064b50;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kEndOfCentralDirSize = 22;
constexpr std::size_t kZip64LocatorSize = 20;
constexpr std::size_t kMaxZipComment = 0xFFFF;

std::uint16_t get_u16(const std::string& b, const std::size_t off) {
    return static_cast<std::uint16_t>(static_cast<unsigned char>(b[off]) |
                                      (static_cast<unsigned char>(b[off + 1]) << 8));
}

std::uint32_t get_u32(const std::string& b, const std::size_t off) {
    return static_cast<std::uint32_t>(get_u16(b, off)) | (static_cast<std::uint32_t>(get_u16(b, off + 2)) << 16);
}

void set_u16(std::string& b, const std::size_t off, const std::uint16_t v) {
    b[off] = static_cast<char>(v & 0xFF);
    b[off + 1] = static_cast<char>(v >> 8);
}

void set_u32(std::string& b, const std::size_t off, const std::uint32_t v) {
    set_u16(b, off, static_cast<std::uint16_t>(v & 0xFFFF));
    set_u16(b, off + 2, static_cast<std::uint16_t>(v >> 16));
}

void put_u16(std::string& out, const std::uint16_t v) {
    out.append(2, '\0');
    set_u16(out, out.size() - 2, v);
}

void put_u32(std::string& out, const std::uint32_t v) {
    out.append(4, '\0');
    set_u32(out, out.size() - 4, v);
}

struct DosTimestamp {
    std::uint16_t time;
    std::uint16_t date;
};

DosTimestamp dos_timestamp_now() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    const int year = std::max(local.tm_year - 80, 0);
    return {static_cast<std::uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2)),
            static_cast<std::uint16_t>((year << 9) | ((local.tm_mon + 1) << 5) | local.tm_mday)};
}

/*
 * libarchive always puts UT/ux extra fields and a data descriptor on an
 * entry, OCF allows neither on mimetype. The entry is written here in front
 * of the archive libarchive produced and its central directory is shifted.
 */
std::string prepend_stored_mimetype(const std::string& zip, const std::string& mimetype, const fs::path& output_path) {
    if (zip.size() < kEndOfCentralDirSize) {
        throw ContainerIOError("Archive is truncated", output_path);
    }

    std::size_t eocd = std::string::npos;
    const std::size_t last = zip.size() - kEndOfCentralDirSize;
    const std::size_t first = last > kMaxZipComment ? last - kMaxZipComment : 0;
    for (std::size_t pos = last + 1; pos-- > first;) {
        if (get_u32(zip, pos) == kEndOfCentralDirSig) { eocd = pos; break; }
    }
    if (eocd == std::string::npos) {
        throw ContainerIOError("End of central directory not found", output_path);
    }
    if (eocd >= kZip64LocatorSize && get_u32(zip, eocd - kZip64LocatorSize) == kZip64LocatorSig) {
        throw ContainerIOError("ZIP64 archives are not supported", output_path);
    }

    const std::uint16_t entries = get_u16(zip, eocd + 10);
    const std::uint32_t cd_size = get_u32(zip, eocd + 12);
    const std::uint32_t cd_offset = get_u32(zip, eocd + 16);
    if (entries >= 0xFFFE || static_cast<std::uint64_t>(cd_offset) + cd_size > eocd) {
        throw ContainerIOError("Unexpected central directory layout", output_path);
    }

    const std::string name = "mimetype";
    const auto crc = static_cast<std::uint32_t>(
        crc32(0L, reinterpret_cast<const Bytef*>(mimetype.data()), static_cast<uInt>(mimetype.size())));
    const auto size = static_cast<std::uint32_t>(mimetype.size());
    const DosTimestamp stamp = dos_timestamp_now();

    std::string local;
    put_u32(local, kLocalHeaderSig);
    put_u16(local, 10); // version needed 1.0
    put_u16(local, 0);  // flags
    put_u16(local, 0);  // stored
    put_u16(local, stamp.time);
    put_u16(local, stamp.date);
    put_u32(local, crc);
    put_u32(local, size);
    put_u32(local, size);
    put_u16(local, static_cast<std::uint16_t>(name.size()));
    put_u16(local, 0);  // no extra field
    local += name;
    local += mimetype;
    const auto shift = static_cast<std::uint32_t>(local.size());

    std::string central;
    put_u32(central, kCentralHeaderSig);
    put_u16(central, 0x0314); // made by unix, 2.0
    put_u16(central, 10);
    put_u16(central, 0);
    put_u16(central, 0);
    put_u16(central, stamp.time);
    put_u16(central, stamp.date);
    put_u32(central, crc);
    put_u32(central, size);
    put_u32(central, size);
    put_u16(central, static_cast<std::uint16_t>(name.size()));
    put_u16(central, 0);  // extra
    put_u16(central, 0);  // comment
    put_u16(central, 0);  // disk
    put_u16(central, 0);  // internal attributes
    put_u32(central, 0100644u << 16);
    put_u32(central, 0);  // local header offset
    central += name;

    std::string directory = zip.substr(cd_offset, cd_size);
    for (std::size_t pos = 0; pos < directory.size();) {
        if (pos + kCentralHeaderSize > directory.size() || get_u32(directory, pos) != kCentralHeaderSig) {
            throw ContainerIOError("Corrupt central directory", output_path);
        }
        const std::uint32_t offset = get_u32(directory, pos + 42);
        if (offset == 0xFFFFFFFF || offset > 0xFFFFFFFF - shift) {
            throw ContainerIOError("ZIP64 archives are not supported", output_path);
        }
        set_u32(directory, pos + 42, offset + shift);
        pos += kCentralHeaderSize + get_u16(directory, pos + 28) + get_u16(directory, pos + 30) +
               get_u16(directory, pos + 32);
    }

    std::string end_record = zip.substr(eocd);
    set_u16(end_record, 8, static_cast<std::uint16_t>(entries + 1));
    set_u16(end_record, 10, static_cast<std::uint16_t>(entries + 1));
    set_u32(end_record, 12, cd_size + static_cast<std::uint32_t>(central.size()));
    set_u32(end_record, 16, cd_offset + shift);

    std::string out;
    out.reserve(local.size() + zip.size() + central.size());
    out += local;
    out.append(zip, 0, cd_offset);
    out += central;
    out += directory;
    out += end_record;
    return out;
}

void move_into_place(const fs::path& tmp_path, const fs::path& output_path) {
    std::error_code ec;
    fs::rename(tmp_path, output_path, ec);
    if (!ec) return;

    Logger::log(LogLevel::Debug, "Rename failed (" + ec.message() + "), falling back to copy", container_tag());
    std::error_code ec_copy;
    fs::copy_file(tmp_path, output_path, fs::copy_options::overwrite_existing, ec_copy);
    if (ec_copy) {
        throw ContainerIOError("Failed to move output into place (" + ec_copy.message() + ")", output_path);
    }
    fs::remove(tmp_path, ec);
}

} // namespace

ContainerInfo EpubContainer::inspect(const fs::path& input_path) {
    ContainerInfo info;
    check_plausible_file(input_path, info.file_size);

    auto in = open_zip_for_reading(input_path);
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        const char* ename = archive_entry_pathname(entry);
        const std::string name = ename ? ename : "";
        if (name == "mimetype") {
            info.has_mimetype = true;
            info.mimetype_first = info.entry_names.empty();
        }
        info.entry_names.push_back(name);
        archive_read_data_skip(in.get());
    }
    if (r != ARCHIVE_EOF) {
        throw InvalidInputError("Input file is not a valid ZIP/EPUB (" + archive_message(in.get()) + ")",
                                input_path);
    }

    Logger::log(LogLevel::Debug,
                "EPUB contains " + std::to_string(info.entry_names.size()) + " files",
                container_tag());
    return info;
}

ScopedTempDir EpubContainer::extract(const fs::path& input_path) {
    std::vector<Warning> ignored;
    return extract(input_path, ignored);
}

ScopedTempDir EpubContainer::extract(const fs::path& input_path, std::vector<Warning>& warnings) {
    std::uintmax_t size = 0;
    check_plausible_file(input_path, size);
    Logger::log(LogLevel::Info, "Extracting EPUB: " + input_path.filename().string(), container_tag());

    auto in = open_zip_for_reading(input_path);

    std::optional<ScopedTempDir> temp;
    try {
        temp.emplace(input_path, "epub");
    } catch (const fs::filesystem_error& e) {
        throw ContainerIOError(std::string("Failed to create working directory (") + e.what() + ")", input_path);
    }
    const fs::path& root = temp->path();

    bool has_mimetype = false;
    size_t count = 0;
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(in.get()), container_tag());
        }
        const char* ename = archive_entry_pathname(entry);
        const std::string name = ename ? ename : "";

        fs::path out_path;
        if (!sanitize_entry_path(name, root, out_path)) {
            if (name.empty() || name == "/" || name == "./") {
                archive_read_data_skip(in.get());
                continue;
            }
            throw InvalidInputError("Archive entry escapes the extraction root (" + name + ")", input_path);
        }
        if (name == "mimetype") has_mimetype = true;

        std::error_code ec;
        if (archive_entry_filetype(entry) == AE_IFDIR) {
            fs::create_directories(out_path, ec);
            if (ec) {
                throw ContainerIOError("Failed to create directory " + out_path.string() +
                                       " (" + ec.message() + ")", input_path);
            }
            archive_read_data_skip(in.get());
            continue;
        }

        fs::create_directories(out_path.parent_path(), ec);
        if (ec) {
            throw ContainerIOError("Failed to create parent dir " + out_path.parent_path().string() +
                                   " (" + ec.message() + ")", input_path);
        }

        std::ofstream ofs(out_path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw ContainerIOError("Failed to create file during extraction: " + out_path.string(), input_path);
        }

        const void* buff = nullptr;
        size_t block_size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rb = archive_read_data_block(in.get(), &buff, &block_size, &offset);
            if (rb == ARCHIVE_EOF) break;
            if (rb == ARCHIVE_WARN) {
                Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(in.get()), container_tag());
            } else if (rb != ARCHIVE_OK) {
                throw ContainerIOError("Corrupt archive member " + name + " (" + archive_message(in.get()) + ")",
                                       input_path);
            }
            ofs.write(static_cast<const char*>(buff), static_cast<std::streamsize>(block_size));
        }
        ofs.close();
        if (!ofs) {
            throw ContainerIOError("Failed to write extracted file " + out_path.string(), input_path);
        }
        ++count;
    }

    if (r != ARCHIVE_EOF) {
        if (count == 0 && !has_mimetype) {
            throw InvalidInputError("Input file is not a valid ZIP/EPUB (" + archive_message(in.get()) + ")",
                                    input_path);
        }
        throw ContainerIOError("Archive iteration error (" + archive_message(in.get()) + ")", input_path);
    }

    if (!has_mimetype) {
        Logger::log(LogLevel::Warning, "EPUB missing 'mimetype' file - may be malformed", container_tag());
        warnings.push_back({WarningKind::MissingMimetype, "EPUB has no mimetype entry", input_path});
    }

    Logger::log(LogLevel::Debug,
                "Extracted " + std::to_string(count) + " files to " + root.string(),
                container_tag());
    return std::move(*temp);
}

std::uintmax_t EpubContainer::pack(const fs::path& source_dir, const fs::path& output_path) {
    Logger::log(LogLevel::Info, "Packing EPUB: " + output_path.filename().string(), container_tag());

    std::error_code ec;
    if (!fs::is_directory(source_dir, ec)) {
        throw ContainerIOError("Source directory not found", source_dir);
    }

    const fs::path parent = output_path.has_parent_path() ? output_path.parent_path() : fs::path(".");
    fs::create_directories(parent, ec);
    if (ec) {
        throw ContainerIOError("Failed to create output directory (" + ec.message() + ")", parent);
    }

    // collect regular files in a stable order, mimetype excluded
    std::vector<std::pair<std::string, fs::path>> files;
    for (fs::recursive_directory_iterator it(source_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        const std::string rel = it->path().lexically_relative(source_dir).generic_string();
        if (rel == "mimetype") continue;
        files.emplace_back(rel, it->path());
    }
    if (ec) {
        throw ContainerIOError("Failed to walk source directory (" + ec.message() + ")", source_dir);
    }
    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    const fs::path tmp_path = parent /
        ("." + output_path.filename().string() + ".tmp" + RandomUtils::random_suffix());

    try {
        ArchiveWriter out(archive_write_new());
        if (!out) {
            throw ContainerIOError("archive_write_new failed", output_path);
        }
        const int set_fmt = archive_write_set_format_zip(out.get());
        if (set_fmt != ARCHIVE_OK) {
            throw ContainerIOError("Failed to set ZIP format (" + archive_message(out.get()) + ")", output_path);
        }
        set_zip_option(out.get(), "compression", "deflate", output_path);
        set_zip_option(out.get(), "compression-level", "9", output_path);

        const int open_w = archive_write_open_filename(out.get(), tmp_path.string().c_str());
        if (open_w != ARCHIVE_OK) {
            throw ContainerIOError("Failed to open output for writing (" + archive_message(out.get()) + ")",
                                   output_path);
        }

        for (const auto& [rel, path] : files) {
            write_entry(out.get(), rel, read_file(path), output_path);
        }

        if (archive_write_close(out.get()) != ARCHIVE_OK) {
            throw ContainerIOError("Failed to close archive (" + archive_message(out.get()) + ")", output_path);
        }
        out.reset();

        // mimetype goes first, stored
        std::string mimetype(kEpubMimetype);
        const fs::path mimetype_path = source_dir / "mimetype";
        if (fs::is_regular_file(mimetype_path, ec)) {
            mimetype = read_file(mimetype_path);
            if (mimetype != kEpubMimetype) {
                Logger::log(LogLevel::Warning, "Unexpected mimetype content: '" + mimetype + "'", container_tag());
            }
        } else {
            Logger::log(LogLevel::Warning, "Source tree has no mimetype file, writing the standard one",
                        container_tag());
        }
        write_file(tmp_path, prepend_stored_mimetype(read_file(tmp_path), mimetype, output_path));
        Logger::log(LogLevel::Debug, "Packed " + std::to_string(files.size() + 1) + " files", container_tag());

        move_into_place(tmp_path, output_path);
    } catch (const ContainerIOError&) {
        fs::remove(tmp_path, ec);
        throw;
    } catch (const std::exception& e) {
        fs::remove(tmp_path, ec);
        throw ContainerIOError(std::string("Failed to create EPUB (") + e.what() + ")", output_path);
    }

    const auto written = fs::file_size(output_path, ec);
    if (ec) {
        throw ContainerIOError("Can't stat written output (" + ec.message() + ")", output_path);
    }
    return written;
}

} // namespace inkpress
