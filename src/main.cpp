#include "classify/failure_classifier.h"
#include "config/config.h"
#include "context/context_extractor.h"
#include "fix/fix_requester.h"
#include "frontend/frontend_registry.h"
#include "index/symbol_indexer.h"
#include "model/http_model_client.h"
#include "orchestrator/generation_orchestrator.h"
#include "orchestrator/repair_orchestrator.h"
#include "patch/patch_engine.h"
#include "runner/command_test_runner.h"
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cerr << "usage: " << program << " <repair|generate|index>\n"
              << "Settings are read from TESTFORGE_* environment variables.\n";
}

int run_index(const testforge::Config& config, const testforge::FrontendRegistry& registry) {
    testforge::SymbolIndexer indexer(registry, testforge::default_exclusion({config.test_dir}));
    auto index = indexer.build(config.project_root);

    spdlog::info("Indexed {} files, {} symbols, {} routes", index.files().size(), index.size(),
                 index.routes().size());
    for (const auto& symbol : index.symbols()) {
        std::cout << symbol.file << ':' << symbol.start_line() << '-' << symbol.end_line() << ' '
                  << testforge::to_string(symbol.kind) << ' ' << symbol.qualified_name << '\n';
    }
    for (const auto& skipped : index.skipped_files()) {
        spdlog::warn("Skipped {}: {}", skipped.path, skipped.reason);
    }
    return index.skipped_files().empty() ? 0 : 2;
}

int run_repair(const testforge::Config& config, const testforge::FrontendRegistry& registry) {
    testforge::CommandTestRunner runner(config);
    testforge::ContextExtractor extractor(config.project_root, registry, config.external_modules);
    testforge::PatchEngine patcher(registry);
    testforge::RuleClassifier rules;

    std::unique_ptr<testforge::HttpModelClient> client;
    std::unique_ptr<testforge::ModelClassifier> model;
    std::unique_ptr<testforge::FixRequester> fixer;
    if (!config.model_enabled()) {
        spdlog::warn("Model disabled, classifying with rules only");
    } else {
        client = std::make_unique<testforge::HttpModelClient>(config);
        model = std::make_unique<testforge::ModelClassifier>(*client, config.max_context_bytes);
        fixer = std::make_unique<testforge::FixRequester>(*client, config.max_context_bytes);
    }
    testforge::FailureClassifier classifier(rules, model.get());

    testforge::RepairOrchestrator orchestrator(config, runner, extractor, classifier, fixer.get(),
                                               patcher);
    auto report = orchestrator.run();
    for (const auto& line : report.summary_lines()) {
        spdlog::info("{}", line);
    }
    return report.aborted_reason().empty() ? 0 : 1;
}

int run_generate(const testforge::Config& config, const testforge::FrontendRegistry& registry) {
    if (!config.model_enabled()) {
        spdlog::error("Test generation needs a model, set TESTFORGE_MODEL_URL");
        return 1;
    }
    testforge::CommandTestRunner runner(config);
    testforge::ContextExtractor extractor(config.project_root, registry, config.external_modules);
    testforge::PatchEngine patcher(registry);
    testforge::HttpModelClient client(config);
    testforge::SymbolIndexer indexer(registry, testforge::default_exclusion({config.test_dir}));
    testforge::TestGenerator generator(client, extractor, patcher,
                                       std::filesystem::path(config.project_root) / config.generated_dir,
                                       config.max_context_bytes);

    testforge::GenerationOrchestrator orchestrator(config, runner, indexer, generator);
    auto report = orchestrator.run();
    spdlog::info("Coverage {:.1f}% -> {:.1f}%, {} files written", report.initial_coverage,
                 report.final_coverage, report.generated_files().size());
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        print_usage(argv[0]);
        return 64;
    }
    std::string command = argv[1];

    try {
        auto& config = testforge::get_config();

        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Starting testforge {} in {}", command, config.project_root);

        auto registry = testforge::FrontendRegistry::with_defaults();
        if (command == "index") return run_index(config, registry);
        if (command == "repair") return run_repair(config, registry);
        if (command == "generate") return run_generate(config, registry);

        print_usage(argv[0]);
        return 64;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
