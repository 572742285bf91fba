#include "orchestrator/generation_orchestrator.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace testforge {

std::filesystem::path generation_report_path(const Config& config) {
    std::filesystem::path path = std::filesystem::path(config.project_root) / config.report_path;
    auto stem = path.stem().string();
    auto ext = path.has_extension() ? path.extension().string() : std::string(".json");
    return path.replace_filename(stem + "_generation" + ext);
}

GenerationOrchestrator::GenerationOrchestrator(const Config& config, TestRunner& runner,
                                               const SymbolIndexer& indexer,
                                               const TestGenerator& generator)
    : config_(config),
      root_(config.project_root),
      runner_(runner),
      indexer_(indexer),
      generator_(generator) {
}

GenerationReport GenerationOrchestrator::run() {
    GenerationReport report;
    double previous = 0.0;

    std::optional<ChangeSet> changes;
    ChangeState state;
    std::map<std::string, std::string> hashes;
    if (config_.incremental) {
        state = ChangeState::load(change_state_path(config_));
        hashes = hash_sources(root_, indexer_.build(root_).files());
        changes = state.diff(hashes);
        if (config_.force_generation) {
            for (const auto& entry : hashes) changes->changed.insert(entry.first);
        }
        spdlog::info("{} sources changed, {} deleted since the last generation run",
                     changes->changed.size(), changes->deleted.size());
        if (changes->empty()) {
            report.stopped_reason = "no source changes";
            write_report(report);
            return report;
        }
        report.removed_files = remove_stale_tests(state, *changes);
    }

    for (int iteration = 1;; ++iteration) {
        std::string reason;
        auto coverage = measure(reason);
        if (!coverage) {
            report.stopped_reason = reason;
            break;
        }
        double percent = coverage->percent();
        if (iteration == 1) report.initial_coverage = percent;
        report.final_coverage = percent;
        spdlog::info("Coverage before pass {}: {:.1f}%", iteration, percent);

        if (percent >= config_.coverage_target) {
            report.stopped_reason = "coverage target reached";
            break;
        }
        if (iteration > 1 && percent <= previous) {
            report.stopped_reason = "coverage did not improve";
            break;
        }
        if (iteration > config_.max_iterations) {
            report.stopped_reason = "iteration limit reached";
            break;
        }
        previous = percent;

        SymbolIndex index = indexer_.build(root_);
        auto gaps = map_gaps(index, *coverage);
        GapSummary summary = summarize_gaps(gaps, *coverage);
        spdlog::info("{} symbols indexed, {} with uncovered lines", index.size(), summary.gap_count);
        for (const auto& [file, missing] : summary.missing_lines_per_file) {
            spdlog::debug("  {}: {} uncovered lines", file, missing);
        }

        GenerationIteration pass;
        pass.iteration = iteration;
        pass.coverage_before = percent;
        pass.gap_count = gaps.size();

        for (auto kind : {GenerationKind::Unit, GenerationKind::Integration, GenerationKind::EndToEnd}) {
            auto candidates = candidates_for(kind, index);
            auto targets = config_.gap_focused ? gapped_targets(candidates, gaps) : candidates;
            if (changes) {
                targets.erase(std::remove_if(targets.begin(), targets.end(),
                                             [&](const Symbol& t) { return changes->changed.count(t.file) == 0; }),
                              targets.end());
            }
            if (targets.empty()) {
                spdlog::debug("No {} targets", to_string(kind));
                continue;
            }
            pass.target_count += targets.size();
            auto files = generator_.generate(targets, kind, batch_size_for(kind, config_), gaps);
            pass.files.insert(pass.files.end(), files.begin(), files.end());
        }
        report.iterations.push_back(pass);

        if (pass.files.empty()) {
            report.stopped_reason = "no test files generated";
            break;
        }
    }

    spdlog::info("Generation stopped: {} ({:.1f}% -> {:.1f}%)", report.stopped_reason,
                 report.initial_coverage, report.final_coverage);
    if (changes && !report.generated_files().empty()) {
        record_generation(state, hashes, *changes, report);
    }
    write_report(report);
    return report;
}

void GenerationOrchestrator::write_report(const GenerationReport& report) const {
    try {
        report.write(generation_report_path(config_));
    } catch (const ReportError& e) {
        spdlog::error("{}", e.what());
    }
}

std::vector<std::string> GenerationOrchestrator::remove_stale_tests(ChangeState& state,
                                                                    const ChangeSet& changes) const {
    std::vector<std::string> removed;
    auto dir = root_ / config_.generated_dir;
    auto drop = [&](const std::string& source) {
        for (const auto& test : state.tests_for(source)) {
            std::error_code ec;
            if (std::filesystem::remove(dir / test, ec)) {
                spdlog::info("Removed {} generated for {}", test, source);
                removed.push_back((dir / test).string());
            } else if (ec) {
                spdlog::warn("Cannot remove {}: {}", (dir / test).string(), ec.message());
            }
        }
        state.forget(source);
    };
    for (const auto& source : changes.deleted) drop(source);
    for (const auto& source : changes.changed) drop(source);
    return removed;
}

void GenerationOrchestrator::record_generation(ChangeState& state,
                                               const std::map<std::string, std::string>& hashes,
                                               const ChangeSet& changes,
                                               const GenerationReport& report) const {
    std::map<std::string, std::vector<std::string>> tests;
    for (const auto& iteration : report.iterations) {
        for (const auto& file : iteration.files) {
            for (const auto& source : file.sources) {
                if (changes.changed.count(source)) {
                    tests[source].push_back(std::filesystem::path(file.path).filename().string());
                }
            }
        }
    }
    for (auto& [source, names] : tests) {
        state.set_tests(source, std::move(names));
    }
    state.set_hashes(hashes);
    try {
        state.save(change_state_path(config_));
    } catch (const ReportError& e) {
        spdlog::error("{}", e.what());
    }
}

std::optional<CoverageMap> GenerationOrchestrator::measure(std::string& reason) {
    try {
        return load_cobertura(runner_.run_with_coverage());
    } catch (const ReportError& e) {
        reason = e.what();
    } catch (const CoverageError& e) {
        reason = e.what();
    }
    spdlog::error("Coverage measurement failed: {}", reason);
    return std::nullopt;
}

std::vector<Symbol> GenerationOrchestrator::candidates_for(GenerationKind kind,
                                                           const SymbolIndex& index) const {
    switch (kind) {
        case GenerationKind::Unit:
            return index.unit_targets();
        case GenerationKind::Integration: {
            auto routes = index.route_targets();
            return routes.empty() ? index.unit_targets() : routes;
        }
        case GenerationKind::EndToEnd:
            return index.route_targets();
    }
    return {};
}

}  // namespace testforge
