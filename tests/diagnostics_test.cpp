#include "../libinkpress/include/diagnostics.hpp"
#include "../libinkpress/include/version.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>

using namespace inkpress;

TEST(DiagnosticsTest, FormatsUtcTimestamps) {
    EXPECT_EQ(format_utc(std::chrono::system_clock::time_point{}), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_utc(std::chrono::system_clock::time_point{std::chrono::seconds(1700000000)}),
              "2023-11-14T22:13:20Z");
}

TEST(DiagnosticsTest, SerializesEveryField) {
    DiagnosticsRecord record;
    record.build_time = std::chrono::system_clock::time_point{};
    record.provenance = {"1234", "deadbeef"};
    record.input_file = "daily.epub";
    record.output_file = "daily.epub";
    record.raw_size_bytes = 40960;
    record.input_mime = "application/epub+zip";
    record.processing_time = std::chrono::milliseconds(250);
    record.sections_found = {"Markets", "Opinion"};
    record.article_count = 12;
    record.spine_entries_removed = 2;
    record.images_removed = 7;
    record.titles_shortened = 5;
    record.warning_count = 1;

    const auto json = nlohmann::json::parse(record.to_json());
    EXPECT_EQ(json["build_time"], "1970-01-01T00:00:00Z");
    EXPECT_EQ(json["workflow_run_id"], "1234");
    EXPECT_EQ(json["git_sha"], "deadbeef");
    EXPECT_EQ(json["raw_size_bytes"], 40960);
    EXPECT_EQ(json["input_mime"], "application/epub+zip");
    EXPECT_EQ(json["processing_time_ms"], 250);
    EXPECT_EQ(json["debug_mode"], false);
    EXPECT_EQ(json["sections_found"], nlohmann::json::array({"Markets", "Opinion"}));
    EXPECT_EQ(json["article_count"], 12);
    EXPECT_EQ(json["images_removed"], 7);
    EXPECT_EQ(json["warning_count"], 1);
    EXPECT_EQ(json["tool_version"], INKPRESS_VERSION);
}

TEST(DiagnosticsTest, ProvenanceFallsBackWhenUnset) {
    unsetenv("WORKFLOW_RUN_ID");
    setenv("GIT_SHA", "", 1);
    const auto p = Provenance::from_environment();
    EXPECT_EQ(p.workflow_run_id, "local");
    EXPECT_EQ(p.git_sha, "unknown");
    unsetenv("GIT_SHA");
}

TEST(DiagnosticsTest, ProvenanceReadsEnvironment) {
    setenv("WORKFLOW_RUN_ID", "987", 1);
    setenv("GIT_SHA", "cafef00d", 1);
    const auto p = Provenance::from_environment();
    EXPECT_EQ(p.workflow_run_id, "987");
    EXPECT_EQ(p.git_sha, "cafef00d");
    unsetenv("WORKFLOW_RUN_ID");
    unsetenv("GIT_SHA");
}
