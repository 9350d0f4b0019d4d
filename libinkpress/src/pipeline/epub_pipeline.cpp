#include "../../include/epub_pipeline.hpp"
#include "../../include/epub_container.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/media_stripper.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/navigation_rewriter.hpp"
#include "../../include/package_document.hpp"
#include "../../include/random_utils.hpp"
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace inkpress {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

static const char* pipeline_tag() {
    return "EpubPipeline";
}

namespace {

std::chrono::milliseconds elapsed_since(const Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

void validate_input(const fs::path& input) {
    std::error_code ec;
    if (!fs::exists(input, ec)) {
        throw InvalidInputError("Input file does not exist", input);
    }
    if (to_lower_copy(input.extension().string()) != ".epub") {
        throw InvalidInputError("Input is not an .epub file", input);
    }
}

// creates the output directory and checks a file can be created in it
void validate_output(const fs::path& output) {
    fs::path dir = output.parent_path();
    if (dir.empty()) dir = ".";

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw InvalidInputError("Cannot create output directory (" + ec.message() + ")", dir);
    }

    const fs::path probe = dir / (".inkpress-probe-" + RandomUtils::random_suffix());
    {
        std::ofstream f(probe, std::ios::binary);
        if (!f) {
            throw InvalidInputError("Output directory is not writable", dir);
        }
    }
    fs::remove(probe, ec);
}

struct RunState {
    fs::path input;
    fs::path output;
    Clock::time_point started;
    std::string input_mime;
    std::optional<ScopedTempDir> work_dir;
    std::optional<PackageDocument> package;
    std::size_t article_count = 0;
    std::vector<std::string> sections;
    ProcessResult result;
};

} // namespace

EpubPipeline::EpubPipeline(PipelineOptions options, EventBus& bus)
    : options_(std::move(options)), event_bus_(bus) {
    if (options_.max_title_length < kMinTitleLength) {
        throw std::invalid_argument("max title length must be at least " + std::to_string(kMinTitleLength));
    }
}

ProcessResult EpubPipeline::process(const fs::path& input, const fs::path& output) {
    RunState run;
    run.input = input;
    run.output = output;
    run.started = Clock::now();
    run.result.input = input;
    run.result.output = output;

    auto warn = [&](const PipelineStage stage, Warning warning, const bool already_logged = false) {
        if (!already_logged) {
            Logger::log(LogLevel::Warning, warning.message + (warning.path.empty() ? "" : ": " + warning.path.string()),
                        pipeline_tag());
        }
        event_bus_.publish(WarningEvent{run.input, stage, warning});
        run.result.warnings.push_back(std::move(warning));
    };

    // runs one stage; the body returns true when it had nothing to do
    auto stage = [&](const PipelineStage id, auto&& body) {
        event_bus_.publish(StageStartEvent{run.input, id});
        Logger::log(LogLevel::Debug, std::string("Stage ") + stage_to_string(id), pipeline_tag());
        const auto t0 = Clock::now();
        bool skipped = false;
        try {
            skipped = body();
        } catch (const InkpressError& e) {
            Logger::log(LogLevel::Error, e.what(), pipeline_tag());
            event_bus_.publish(PipelineErrorEvent{run.input, id, e.kind(), e.what()});
            throw;
        } catch (const std::exception& e) {
            // filesystem and allocation failures below the container layer
            ContainerIOError wrapped(std::string(stage_to_string(id)) + " failed (" + e.what() + ")", run.input);
            Logger::log(LogLevel::Error, wrapped.what(), pipeline_tag());
            event_bus_.publish(PipelineErrorEvent{run.input, id, wrapped.kind(), wrapped.what()});
            throw wrapped;
        }
        event_bus_.publish(StageCompleteEvent{run.input, id, skipped, elapsed_since(t0)});
    };

    Logger::log(LogLevel::Info, "Processing " + input.string(), pipeline_tag());

    stage(PipelineStage::Validate, [&] {
        validate_input(run.input);
        run.input_mime = MimeDetector::detect(run.input);
        if (!run.input_mime.empty() && !MimeDetector::is_zip_family(run.input_mime)) {
            throw InvalidInputError("Input is not a ZIP container (detected " + run.input_mime + ")", run.input);
        }
        run.result.input_size = EpubContainer::inspect(run.input).file_size;
        validate_output(run.output);
        return false;
    });

    stage(PipelineStage::Extract, [&] {
        std::vector<Warning> container_warnings;
        run.work_dir.emplace(EpubContainer::extract(run.input, container_warnings));
        for (auto& w : container_warnings) warn(PipelineStage::Extract, std::move(w), true);
        return false;
    });

    const fs::path& root = run.work_dir->path();

    stage(PipelineStage::ParseOPF, [&] {
        run.package.emplace(PackageDocument::parse(locate_package_document(root)));
        const auto spine_size = run.package->spine().size();
        run.article_count = spine_size > options_.skip_leading_pages ? spine_size - options_.skip_leading_pages : 0;
        Logger::log(LogLevel::Info, "Found " + std::to_string(spine_size) + " spine items, " +
                    std::to_string(run.package->manifest().size()) + " manifest items", pipeline_tag());
        return false;
    });

    PackageDocument& package = *run.package;

    stage(PipelineStage::TrimSpine, [&] {
        const std::size_t n = options_.skip_leading_pages;
        if (n == 0) return true;
        const std::size_t k = package.spine().size();
        run.result.spine_entries_removed = package.remove_leading_spine_entries(n);
        if (k <= n) {
            warn(PipelineStage::TrimSpine,
                 {WarningKind::SpineShape,
                  "Spine has " + std::to_string(k) + " entries, expected more than " + std::to_string(n),
                  package.path()});
        }
        Logger::log(LogLevel::Info, "Removed " + std::to_string(run.result.spine_entries_removed) +
                    " leading spine entries", pipeline_tag());
        return false;
    });

    stage(PipelineStage::StripImages, [&] {
        if (!options_.strip_images) return true;
        auto stripped = MediaStripper{}.strip_images(root, package);
        run.result.images_removed = stripped.files_removed;
        run.result.markup_files_rewritten = stripped.markup_files_rewritten;
        for (auto& w : stripped.warnings) warn(PipelineStage::StripImages, std::move(w), true);
        return false;
    });

    stage(PipelineStage::ReplaceStylesheet, [&] {
        if (!options_.stylesheet) return true;
        const fs::path& source = *options_.stylesheet;
        std::error_code ec;
        if (!fs::is_regular_file(source, ec)) {
            warn(PipelineStage::ReplaceStylesheet,
                 {WarningKind::StylesheetMissing, "Replacement stylesheet not found", source});
            return true;
        }
        const fs::path target = package.directory() / "stylesheet.css";
        write_file(target, read_file(source));
        Logger::log(LogLevel::Info, "Updated stylesheet (" + std::to_string(file_size_or_zero(target)) + " bytes)",
                    pipeline_tag());
        return false;
    });

    stage(PipelineStage::RewriteNavigation, [&] {
        const auto max_len = options_.max_title_length;
        const LabelTransform transform = [max_len](const std::string_view label) {
            return shorten_title(label, max_len);
        };
        bool any = false;
        for (const auto& rewriter : make_navigation_rewriters()) {
            const auto document = rewriter->locate(package);
            if (!document) {
                Logger::log(LogLevel::Debug, std::string("No ") + std::string(rewriter->get_name()) +
                            " document, skipping", pipeline_tag());
                continue;
            }
            any = true;
            try {
                const auto stats = rewriter->rewrite(*document, transform);
                run.result.titles_shortened += stats.labels_changed;
                if (run.sections.empty()) run.sections = stats.sections;
            } catch (const NavigationError& e) {
                warn(PipelineStage::RewriteNavigation, {WarningKind::Navigation, e.what(), e.path()});
            }
        }
        return !any;
    });

    stage(PipelineStage::EmbedDiagnostics, [&] {
        DiagnosticsRecord record;
        record.build_time = std::chrono::system_clock::now();
        record.provenance = options_.provenance;
        record.input_file = run.input.filename().string();
        record.output_file = run.output.filename().string();
        record.raw_size_bytes = run.result.input_size;
        record.input_mime = run.input_mime;
        record.processing_time = elapsed_since(run.started);
        record.debug_mode = options_.debug;
        record.sections_found = run.sections;
        record.article_count = run.article_count;
        record.spine_entries_removed = run.result.spine_entries_removed;
        record.images_removed = run.result.images_removed;
        record.titles_shortened = run.result.titles_shortened;
        record.warning_count = run.result.warnings.size();

        write_file(package.directory() / kDiagnosticsFileName, record.to_json());

        // reprocessed outputs already carry the item
        bool registered = false;
        for (const auto& item : package.manifest()) {
            if (item.href == kDiagnosticsFileName) { registered = true; break; }
        }
        if (!registered) {
            package.add_item({package.unique_id(kDiagnosticsItemId), kDiagnosticsFileName, kDiagnosticsMediaType, {}});
        }
        Logger::log(LogLevel::Debug, "Diagnostics: " + record.to_json(), pipeline_tag());
        return false;
    });

    stage(PipelineStage::SerializeOPF, [&] {
        package.save();
        return false;
    });

    stage(PipelineStage::Repack, [&] {
        run.result.output_size = EpubContainer::pack(root, run.output);
        return false;
    });

    stage(PipelineStage::Finalize, [&] {
        if (run.result.output_size < kMinEpubSize) {
            std::error_code ec;
            fs::remove(run.output, ec);
            throw ContainerIOError("Output is smaller than a plausible EPUB (" +
                                   std::to_string(run.result.output_size) + " bytes)", run.output);
        }
        return false;
    });

    run.result.duration = elapsed_since(run.started);
    event_bus_.publish(PipelineCompleteEvent{run.input, run.output, run.result.input_size,
                                             run.result.output_size, run.result.warnings.size(),
                                             run.result.duration});
    Logger::log(LogLevel::Info, "Wrote " + run.output.string() + " (" + std::to_string(run.result.output_size) +
                " bytes, " + std::to_string(run.result.warnings.size()) + " warnings)", pipeline_tag());
    return std::move(run.result);
}

} // namespace inkpress
