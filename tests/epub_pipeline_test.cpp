#include "../libinkpress/include/epub_container.hpp"
#include "../libinkpress/include/epub_pipeline.hpp"
#include "../libinkpress/include/inkpress.hpp"
#include "../libinkpress/include/logger.hpp"
#include "../libinkpress/include/package_document.hpp"
#include "../libinkpress/include/xml_utils.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace inkpress;
using namespace inkpress::test;

namespace {

std::vector<std::string> ncx_labels(const fs::path& ncx) {
    std::string error;
    auto doc = xml::read_xml_file(ncx, error);
    EXPECT_TRUE(doc) << error;
    std::vector<std::string> out;
    if (!doc) return out;
    for (xmlNode* n : xml::collect_elements(xmlDocGetRootElement(doc.get()), [](const xmlNode* node) {
             return xml::is_element(node, "navLabel");
         })) {
        out.push_back(xml::text_content(n));
    }
    return out;
}

std::vector<std::string> spine_ids(const PackageDocument& pkg) {
    std::vector<std::string> ids;
    for (const auto& ref : pkg.spine()) ids.push_back(ref.idref);
    return ids;
}

PipelineOptions test_options() {
    PipelineOptions options;
    options.provenance.workflow_run_id = "run-42";
    options.provenance.git_sha = "abc123";
    return options;
}

class EpubPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::clear_sinks();
        Logger::add_sink(std::make_unique<CapturingLogSink>(log_));
    }

    void TearDown() override {
        Logger::clear_sinks();
    }

    fs::path sample(const SampleOptions& options = {}) {
        return make_sample_epub(dir_ / "src", dir_ / "in" / "daily.epub", options);
    }

    /// extraction roots the container reported while the test ran
    std::vector<fs::path> extraction_roots() const {
        std::vector<fs::path> roots;
        const std::string marker = " files to ";
        for (const auto& line : log_) {
            const auto pos = line.message.find(marker);
            if (line.tag == "EpubContainer" && line.message.starts_with("Extracted") && pos != std::string::npos) {
                roots.emplace_back(line.message.substr(pos + marker.size()));
            }
        }
        return roots;
    }

    TestDir dir_;
    EventBus bus_;
    std::vector<CapturingLogSink::Line> log_;
};

} // namespace

TEST_F(EpubPipelineTest, EndToEndScenario) {
    const auto input = sample();
    const auto output = dir_ / "out" / "nested" / "daily.epub";

    EpubPipeline pipeline(test_options(), bus_);
    const auto result = pipeline.process(input, output);

    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.spine_entries_removed, 2u);
    EXPECT_EQ(result.images_removed, 1u);
    EXPECT_EQ(result.markup_files_rewritten, 3u);
    EXPECT_EQ(result.titles_shortened, 4u); // two labels, in both the NCX and the nav document
    EXPECT_EQ(result.input_size, fs::file_size(input));
    EXPECT_EQ(result.output_size, fs::file_size(output));
    EXPECT_GE(result.output_size, kMinEpubSize);

    const auto info = EpubContainer::inspect(output);
    EXPECT_TRUE(info.mimetype_first);

    const auto extracted = EpubContainer::extract(output);
    const fs::path oebps = extracted.path() / "OEBPS";
    const auto pkg = PackageDocument::parse(oebps / "content.opf");

    EXPECT_EQ(spine_ids(pkg), (std::vector<std::string>{"article1", "article2", "article3"}));
    EXPECT_TRUE(fs::exists(oebps / "images" / "cover.jpg"));
    EXPECT_FALSE(fs::exists(oebps / "images" / "photo.jpg"));
    EXPECT_EQ(pkg.find_item("photo"), nullptr);
    EXPECT_NE(pkg.find_item("cover-image"), nullptr);

    const auto labels = ncx_labels(oebps / "toc.ncx");
    ASSERT_EQ(labels.size(), 5u);
    EXPECT_EQ(std::vector<std::string>(labels.begin() + 2, labels.end()),
              (std::vector<std::string>{"Fed Hikes Rates", "Short Title",
                                        "A Very Long Article Title That Exceeds The..."}));
}

TEST_F(EpubPipelineTest, EmbedsDiagnosticsOutsideTheSpine) {
    const auto input = sample();
    const auto output = dir_ / "out" / "daily.epub";
    EpubPipeline(test_options(), bus_).process(input, output);

    const auto extracted = EpubContainer::extract(output);
    const fs::path oebps = extracted.path() / "OEBPS";
    const auto pkg = PackageDocument::parse(oebps / "content.opf");

    const auto* item = pkg.find_item("diagnostics");
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->href, "_diagnostics.json");
    EXPECT_EQ(item->media_type, "application/json");
    for (const auto& ref : pkg.spine()) {
        EXPECT_NE(ref.idref, "diagnostics");
    }

    const auto json = nlohmann::json::parse(read_text(oebps / "_diagnostics.json"));
    EXPECT_EQ(json["workflow_run_id"], "run-42");
    EXPECT_EQ(json["git_sha"], "abc123");
    EXPECT_EQ(json["input_file"], "daily.epub");
    EXPECT_EQ(json["output_file"], "daily.epub");
    EXPECT_EQ(json["raw_size_bytes"], fs::file_size(input));
    EXPECT_EQ(json["article_count"], 3);
    EXPECT_EQ(json["spine_entries_removed"], 2);
    EXPECT_EQ(json["images_removed"], 1);
    EXPECT_EQ(json["titles_shortened"], 4);
    EXPECT_EQ(json["warning_count"], 0);
    EXPECT_EQ(json["debug_mode"], false);
    EXPECT_TRUE(json["sections_found"].is_array());
    EXPECT_TRUE(json.contains("build_time"));
    EXPECT_TRUE(json.contains("processing_time_ms"));
    EXPECT_TRUE(json.contains("tool_version"));
}

TEST_F(EpubPipelineTest, ReprocessingKeepsASingleDiagnosticsItem) {
    const auto input = sample();
    EpubPipeline pipeline(test_options(), bus_);
    pipeline.process(input, dir_ / "first.epub");

    PipelineOptions again = test_options();
    again.skip_leading_pages = 0;
    EpubPipeline(again, bus_).process(dir_ / "first.epub", dir_ / "second.epub");

    const auto extracted = EpubContainer::extract(dir_ / "second.epub");
    const auto pkg = PackageDocument::parse(extracted.path() / "OEBPS" / "content.opf");
    std::size_t diagnostics = 0;
    for (const auto& item : pkg.manifest()) {
        if (item.media_type == "application/json") ++diagnostics;
    }
    EXPECT_EQ(diagnostics, 1u);
    EXPECT_EQ(pkg.spine().size(), 3u);
}

TEST_F(EpubPipelineTest, PublishesEveryStageInOrder) {
    std::vector<PipelineStage> started;
    std::vector<PipelineStage> completed;
    std::size_t finished = 0;
    bus_.subscribe<StageStartEvent>([&](const StageStartEvent& e) { started.push_back(e.stage); });
    bus_.subscribe<StageCompleteEvent>([&](const StageCompleteEvent& e) { completed.push_back(e.stage); });
    bus_.subscribe<PipelineCompleteEvent>([&](const PipelineCompleteEvent&) { ++finished; });

    EpubPipeline(test_options(), bus_).process(sample(), dir_ / "out.epub");

    const std::vector<PipelineStage> expected = {
        PipelineStage::Validate, PipelineStage::Extract, PipelineStage::ParseOPF, PipelineStage::TrimSpine,
        PipelineStage::StripImages, PipelineStage::ReplaceStylesheet, PipelineStage::RewriteNavigation,
        PipelineStage::EmbedDiagnostics, PipelineStage::SerializeOPF, PipelineStage::Repack,
        PipelineStage::Finalize};
    EXPECT_EQ(started, expected);
    EXPECT_EQ(completed, expected);
    EXPECT_EQ(finished, 1u);
}

TEST_F(EpubPipelineTest, ReleasesWorkingDirectory) {
    EpubPipeline(test_options(), bus_).process(sample(), dir_ / "out.epub");
    const auto roots = extraction_roots();
    ASSERT_EQ(roots.size(), 1u);
    EXPECT_FALSE(fs::exists(roots.front()));
}

TEST_F(EpubPipelineTest, MissingInputIsInvalidInput) {
    EpubPipeline pipeline(test_options(), bus_);
    EXPECT_THROW(pipeline.process(dir_ / "absent.epub", dir_ / "out.epub"), InvalidInputError);
    EXPECT_FALSE(fs::exists(dir_ / "out.epub"));
}

TEST_F(EpubPipelineTest, WrongExtensionIsInvalidInput) {
    const auto input = sample();
    fs::copy_file(input, dir_ / "daily.zip");
    EXPECT_THROW(EpubPipeline(test_options(), bus_).process(dir_ / "daily.zip", dir_ / "out.epub"),
                 InvalidInputError);
    EXPECT_FALSE(fs::exists(dir_ / "out.epub"));
}

TEST_F(EpubPipelineTest, UndersizedOrNonZipInputIsInvalidInput) {
    write_text(dir_ / "tiny.epub", "tiny");
    write_text(dir_ / "text.epub", filler_text(5000, 9));

    std::vector<PipelineErrorEvent> errors;
    bus_.subscribe<PipelineErrorEvent>([&](const PipelineErrorEvent& e) { errors.push_back(e); });

    EpubPipeline pipeline(test_options(), bus_);
    EXPECT_THROW(pipeline.process(dir_ / "tiny.epub", dir_ / "out.epub"), InvalidInputError);
    EXPECT_THROW(pipeline.process(dir_ / "text.epub", dir_ / "out.epub"), InvalidInputError);
    EXPECT_FALSE(fs::exists(dir_ / "out.epub"));

    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].stage, PipelineStage::Validate);
    EXPECT_EQ(errors[0].kind, ErrorKind::InvalidInput);
}

TEST_F(EpubPipelineTest, MissingSpineIsMalformedAndCleansUp) {
    SampleOptions options;
    options.with_spine = false;
    const auto input = sample(options);

    EXPECT_THROW(EpubPipeline(test_options(), bus_).process(input, dir_ / "out.epub"), MalformedPackageError);
    EXPECT_FALSE(fs::exists(dir_ / "out.epub"));

    const auto roots = extraction_roots();
    ASSERT_EQ(roots.size(), 1u);
    EXPECT_FALSE(fs::exists(roots.front()));
}

TEST_F(EpubPipelineTest, BrokenNcxIsAWarningAndNavStillRewritten) {
    SampleOptions options;
    options.ncx_override = "<ncx><navMap><navPoint>";
    const auto input = sample(options);

    const auto result = EpubPipeline(test_options(), bus_).process(input, dir_ / "out.epub");
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings.front().kind, WarningKind::Navigation);
    EXPECT_EQ(result.titles_shortened, 2u);

    const auto extracted = EpubContainer::extract(dir_ / "out.epub");
    EXPECT_EQ(read_text(extracted.path() / "OEBPS" / "toc.ncx"), "<ncx><navMap><navPoint>");
    EXPECT_NE(read_text(extracted.path() / "OEBPS" / "nav.xhtml").find(">Fed Hikes Rates</a>"), std::string::npos);
}

TEST_F(EpubPipelineTest, MissingNavigationIsSkipped) {
    SampleOptions options;
    options.with_ncx = false;
    options.with_nav = false;
    const auto result = EpubPipeline(test_options(), bus_).process(sample(options), dir_ / "out.epub");
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.titles_shortened, 0u);
}

TEST_F(EpubPipelineTest, ShortSpineIsTrimmedToEmptyWithWarning) {
    PipelineOptions options = test_options();
    options.skip_leading_pages = 7;
    const auto result = EpubPipeline(options, bus_).process(sample(), dir_ / "out.epub");

    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings.front().kind, WarningKind::SpineShape);
    EXPECT_EQ(result.spine_entries_removed, 5u);

    const auto extracted = EpubContainer::extract(dir_ / "out.epub");
    EXPECT_TRUE(PackageDocument::parse(extracted.path() / "OEBPS" / "content.opf").spine().empty());
}

TEST_F(EpubPipelineTest, ReplacesStylesheetWhenConfigured) {
    write_text(dir_ / "eink.css", "body { background: white; color: black; }\n");
    PipelineOptions options = test_options();
    options.stylesheet = dir_ / "eink.css";

    const auto result = EpubPipeline(options, bus_).process(sample(), dir_ / "out.epub");
    EXPECT_TRUE(result.warnings.empty());

    const auto extracted = EpubContainer::extract(dir_ / "out.epub");
    EXPECT_EQ(read_text(extracted.path() / "OEBPS" / "stylesheet.css"),
              "body { background: white; color: black; }\n");
}

TEST_F(EpubPipelineTest, MissingStylesheetIsSkippedWithWarning) {
    PipelineOptions options = test_options();
    options.stylesheet = dir_ / "absent.css";

    std::vector<StageCompleteEvent> completed;
    bus_.subscribe<StageCompleteEvent>([&](const StageCompleteEvent& e) { completed.push_back(e); });

    const auto result = EpubPipeline(options, bus_).process(sample(), dir_ / "out.epub");
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings.front().kind, WarningKind::StylesheetMissing);
    EXPECT_EQ(result.warnings.front().path, dir_ / "absent.css");

    const auto it = std::find_if(completed.begin(), completed.end(), [](const StageCompleteEvent& e) {
        return e.stage == PipelineStage::ReplaceStylesheet;
    });
    ASSERT_NE(it, completed.end());
    EXPECT_TRUE(it->skipped);

    const auto extracted = EpubContainer::extract(dir_ / "out.epub");
    EXPECT_EQ(read_text(extracted.path() / "OEBPS" / "stylesheet.css"), "body { font-family: serif; }\n");
}

TEST_F(EpubPipelineTest, KeepImagesSkipsStripping) {
    PipelineOptions options = test_options();
    options.strip_images = false;
    const auto result = EpubPipeline(options, bus_).process(sample(), dir_ / "out.epub");
    EXPECT_EQ(result.images_removed, 0u);

    const auto extracted = EpubContainer::extract(dir_ / "out.epub");
    EXPECT_TRUE(fs::exists(extracted.path() / "OEBPS" / "images" / "photo.jpg"));
}

TEST_F(EpubPipelineTest, RejectsTooSmallTitleBound) {
    PipelineOptions options = test_options();
    options.max_title_length = 9;
    EXPECT_THROW(EpubPipeline pipeline(options, bus_), std::invalid_argument);
}

TEST_F(EpubPipelineTest, DebugModeLogsEveryRewrite) {
    PipelineOptions options = test_options();
    options.debug = true;
    EpubPipeline(options, bus_).process(sample(), dir_ / "out.epub");

    const auto rewrite = std::find_if(log_.begin(), log_.end(), [](const CapturingLogSink::Line& l) {
        return l.level == LogLevel::Debug &&
               l.message == "'Fed Hikes Rates - Bloomberg Markets Wrap' -> 'Fed Hikes Rates'";
    });
    EXPECT_NE(rewrite, log_.end());
}

namespace {

struct RecordingObserver final : InkpressObserver {
    std::vector<std::string> stages;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    std::size_t finished = 0;

    void onStageStart(const std::filesystem::path&, const std::string& stage) override { stages.push_back(stage); }

    void onWarning(const std::filesystem::path&, const std::string& kind, const std::string&) override {
        warnings.push_back(kind);
    }

    void onFinish(const std::filesystem::path&, const std::filesystem::path&, std::uintmax_t,
                  std::uintmax_t size_after) override {
        EXPECT_GT(size_after, 0u);
        ++finished;
    }

    void onError(const std::filesystem::path&, const std::string& error) override { errors.push_back(error); }
};

} // namespace

TEST_F(EpubPipelineTest, FacadeForwardsProgressToObserver) {
    RecordingObserver observer;
    Inkpress ink;
    ink.maxTitleLength(40).skipPages(2).stylesheet(dir_ / "absent.css").provenance("run-7", "");
    ink.setObserver(&observer);

    EXPECT_EQ(ink.options().max_title_length, 40u);
    EXPECT_EQ(ink.options().provenance.workflow_run_id, "run-7");

    const auto result = ink.process(sample(), dir_ / "out.epub");
    ink.setObserver(nullptr);

    EXPECT_EQ(observer.stages.size(), 11u);
    EXPECT_EQ(observer.stages.front(), "Validate");
    EXPECT_EQ(observer.finished, 1u);
    EXPECT_EQ(observer.warnings, (std::vector<std::string>{"StylesheetMissing"}));
    EXPECT_TRUE(observer.errors.empty());
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST_F(EpubPipelineTest, FacadeReportsFatalErrors) {
    RecordingObserver observer;
    Inkpress ink;
    ink.setObserver(&observer);
    EXPECT_THROW(ink.process(dir_ / "absent.epub", dir_ / "out.epub"), InvalidInputError);
    ink.setObserver(nullptr);
    EXPECT_EQ(observer.errors.size(), 1u);
    EXPECT_EQ(observer.finished, 0u);
}

TEST_F(EpubPipelineTest, FacadeRemovesItsLogBridge) {
    const auto sinks_before = Logger::sink_count();
    RecordingObserver observer;
    {
        Inkpress ink;
        ink.setObserver(&observer);
        ink.setObserver(&observer);
        EXPECT_EQ(Logger::sink_count(), sinks_before + 1);
        Inkpress other;
        other.setObserver(&observer);
        EXPECT_EQ(Logger::sink_count(), sinks_before + 2);
    }
    EXPECT_EQ(Logger::sink_count(), sinks_before);
    Logger::log(LogLevel::Info, "after the facades are gone", "test");
}
