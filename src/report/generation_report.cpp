#include "report/generation_report.h"
#include "core/errors.h"
#include "core/text_file.h"
#include <spdlog/spdlog.h>

namespace testforge {

std::vector<std::string> GenerationReport::generated_files() const {
    std::vector<std::string> files;
    for (const auto& iteration : iterations) {
        for (const auto& file : iteration.files) {
            files.push_back(file.path);
        }
    }
    return files;
}

Json::Value GenerationReport::to_json() const {
    Json::Value root;
    root["initial_coverage"] = initial_coverage;
    root["final_coverage"] = final_coverage;
    root["stopped_reason"] = stopped_reason;

    Json::Value list(Json::arrayValue);
    for (const auto& iteration : iterations) {
        Json::Value entry;
        entry["iteration"] = iteration.iteration;
        entry["coverage_before"] = iteration.coverage_before;
        entry["gaps"] = static_cast<Json::UInt64>(iteration.gap_count);
        entry["targets"] = static_cast<Json::UInt64>(iteration.target_count);
        Json::Value files(Json::arrayValue);
        for (const auto& file : iteration.files) {
            Json::Value f;
            f["path"] = file.path;
            f["kind"] = to_string(file.kind);
            f["shard"] = static_cast<Json::UInt64>(file.shard);
            f["targets"] = static_cast<Json::UInt64>(file.target_count);
            files.append(f);
        }
        entry["files"] = files;
        list.append(entry);
    }
    root["iterations"] = list;

    Json::Value generated(Json::arrayValue);
    for (const auto& path : generated_files()) {
        generated.append(path);
    }
    root["generated_files"] = generated;

    Json::Value removed(Json::arrayValue);
    for (const auto& path : removed_files) {
        removed.append(path);
    }
    root["removed_files"] = removed;
    return root;
}

void GenerationReport::write(const std::filesystem::path& path) const {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    try {
        write_text_file(path, Json::writeString(writer, to_json()) + "\n");
    } catch (const Error& e) {
        throw ReportError(std::string("cannot write generation report: ") + e.what());
    }
    spdlog::info("Generation report written to {}", path.string());
}

}  // namespace testforge
