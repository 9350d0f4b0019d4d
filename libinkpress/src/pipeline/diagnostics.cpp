#include "../../include/diagnostics.hpp"
#include "../../include/version.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <ctime>

namespace inkpress {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return fallback;
    return value;
}

} // namespace

Provenance Provenance::from_environment() {
    Provenance p;
    p.workflow_run_id = env_or("WORKFLOW_RUN_ID", p.workflow_run_id);
    p.git_sha = env_or("GIT_SHA", p.git_sha);
    return p;
}

std::string format_utc(const std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf, n);
}

std::string DiagnosticsRecord::to_json() const {
    nlohmann::json j;
    j["build_time"] = format_utc(build_time);
    j["workflow_run_id"] = provenance.workflow_run_id;
    j["git_sha"] = provenance.git_sha;
    j["input_file"] = input_file;
    j["output_file"] = output_file;
    j["raw_size_bytes"] = raw_size_bytes;
    j["input_mime"] = input_mime;
    j["processing_time_ms"] = processing_time.count();
    j["debug_mode"] = debug_mode;
    j["sections_found"] = sections_found;
    j["article_count"] = article_count;
    j["spine_entries_removed"] = spine_entries_removed;
    j["images_removed"] = images_removed;
    j["titles_shortened"] = titles_shortened;
    j["warning_count"] = warning_count;
    j["tool_version"] = INKPRESS_VERSION;
    return j.dump(2);
}

} // namespace inkpress
