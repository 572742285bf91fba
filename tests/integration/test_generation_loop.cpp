#include <gtest/gtest.h>
#include "config/config.h"
#include "context/context_extractor.h"
#include "frontend/frontend_registry.h"
#include "generation/test_generator.h"
#include "index/symbol_indexer.h"
#include "orchestrator/generation_orchestrator.h"
#include "patch/patch_engine.h"
#include "support/fakes.h"
#include "support/temp_project.h"
#include <filesystem>
#include <set>
#include <sstream>

using namespace testforge;
using testforge::fakes::ScriptedModelClient;
using testforge::fakes::ScriptedTestRunner;
using testforge::fakes::TempProject;

namespace {

// 20-line function; the n < 0 branch (lines 14-16) is never exercised
const char* kCalc =
    "def classify(n):\n"
    "    \"\"\"Label a number.\"\"\"\n"
    "    if n is None:\n"
    "        raise ValueError(\"n is required\")\n"
    "    label = \"\"\n"
    "    if n > 100:\n"
    "        label = \"huge\"\n"
    "    elif n > 10:\n"
    "        label = \"large\"\n"
    "    elif n > 0:\n"
    "        label = \"small\"\n"
    "    elif n == 0:\n"
    "        label = \"zero\"\n"
    "    elif n < 0:\n"
    "        sign = \"-\"\n"
    "        label = \"negative\" + sign[:0]\n"
    "    else:\n"
    "        label = \"nan\"\n"
    "    result = label\n"
    "    return result\n";

const char* kGeneratedTest =
    "Covering the negative branch:\n"
    "```python\n"
    "from app.calc import classify\n"
    "\n"
    "\n"
    "def test_classify_negative():\n"
    "    assert classify(-5) == \"negative\"\n"
    "```\n";

std::string cobertura(const std::set<int>& uncovered) {
    const int total = 20;
    double rate = static_cast<double>(total - static_cast<int>(uncovered.size())) / total;
    std::ostringstream out;
    out << "<?xml version=\"1.0\" ?>\n"
        << "<coverage version=\"7.4.0\" line-rate=\"" << rate << "\">\n"
        << "  <packages><package name=\"app\" line-rate=\"" << rate << "\"><classes>\n"
        << "    <class name=\"calc.py\" filename=\"app/calc.py\" line-rate=\"" << rate << "\">\n"
        << "      <lines>\n";
    for (int line = 1; line <= total; ++line) {
        out << "        <line number=\"" << line << "\" hits=\"" << (uncovered.count(line) ? 0 : 3)
            << "\"/>\n";
    }
    out << "      </lines>\n    </class>\n  </classes></package></packages>\n</coverage>\n";
    return out.str();
}

struct GenerationHarness {
    explicit GenerationHarness(const TempProject& project) {
        config.project_root = project.root().string();
        config.generated_dir = "tests/generated";
        config.coverage_target = 90.0;
        config.max_iterations = 3;
        config.gap_focused = true;

        project.write("app/__init__.py", "");
        project.write("app/calc.py", kCalc);
        project.write("tests/test_calc.py",
                      "from app.calc import classify\n"
                      "\n"
                      "\n"
                      "def test_classify_small():\n"
                      "    assert classify(3) == \"small\"\n");
    }

    GenerationReport run() {
        ContextExtractor extractor(config.project_root, registry);
        PatchEngine patcher(registry);
        SymbolIndexer indexer(registry, default_exclusion({config.test_dir}));
        TestGenerator generator(client, extractor, patcher,
                                std::filesystem::path(config.project_root) / config.generated_dir,
                                config.max_context_bytes);
        GenerationOrchestrator orchestrator(config, runner, indexer, generator);
        return orchestrator.run();
    }

    Config config;
    FrontendRegistry registry = FrontendRegistry::with_defaults();
    ScriptedModelClient client;
    ScriptedTestRunner runner;
};

}  // namespace

TEST(GenerationLoopTest, test_uncovered_branch_gets_a_test) {
    TempProject project("generation_gap");
    GenerationHarness harness(project);
    harness.runner.queue_coverage(cobertura({14, 15, 16}));
    harness.runner.queue_coverage(cobertura({}));
    harness.client.reply(kGeneratedTest);
    harness.client.reply(kGeneratedTest);

    auto report = harness.run();

    EXPECT_DOUBLE_EQ(report.initial_coverage, 85.0);
    EXPECT_DOUBLE_EQ(report.final_coverage, 100.0);
    EXPECT_EQ(report.stopped_reason, "coverage target reached");
    EXPECT_EQ(harness.runner.coverage_runs, 2);

    ASSERT_EQ(report.iterations.size(), 1u);
    const GenerationIteration& pass = report.iterations[0];
    EXPECT_EQ(pass.gap_count, 1u);
    ASSERT_FALSE(pass.files.empty());
    EXPECT_EQ(pass.files[0].kind, GenerationKind::Unit);
    EXPECT_EQ(pass.files[0].target_count, 1u);

    for (const auto& file : pass.files) {
        std::filesystem::path path(file.path);
        EXPECT_TRUE(std::filesystem::exists(path)) << file.path;
        EXPECT_EQ(path.parent_path(), project.path("tests/generated"));
        EXPECT_EQ(path.filename().string().rfind("test_", 0), 0u);
    }
    std::string written = project.read("tests/generated/" +
                                       std::filesystem::path(pass.files[0].path).filename().string());
    EXPECT_NE(written.find("def test_classify_negative"), std::string::npos);
    EXPECT_EQ(written.find("```"), std::string::npos);

    // The prompt names the uncovered lines of the target
    ASSERT_FALSE(harness.client.prompts.empty());
    const std::string& prompt = harness.client.prompts[0].second;
    EXPECT_NE(prompt.find("classify"), std::string::npos);
    EXPECT_NE(prompt.find("14-16"), std::string::npos);
    EXPECT_NE(prompt.find("# FILE: app/calc.py"), std::string::npos);

    EXPECT_TRUE(std::filesystem::exists(generation_report_path(harness.config)));
}

TEST(GenerationLoopTest, test_target_already_met_generates_nothing) {
    TempProject project("generation_met");
    GenerationHarness harness(project);
    harness.runner.queue_coverage(cobertura({}));

    auto report = harness.run();
    EXPECT_EQ(report.stopped_reason, "coverage target reached");
    EXPECT_TRUE(report.iterations.empty());
    EXPECT_TRUE(harness.client.prompts.empty());
    EXPECT_FALSE(project.exists("tests/generated"));
}

TEST(GenerationLoopTest, test_stops_when_coverage_stalls) {
    TempProject project("generation_stall");
    GenerationHarness harness(project);
    harness.runner.queue_coverage(cobertura({14, 15, 16}));
    harness.client.reply(kGeneratedTest);
    harness.client.reply(kGeneratedTest);

    auto report = harness.run();
    EXPECT_EQ(report.stopped_reason, "coverage did not improve");
    EXPECT_EQ(report.iterations.size(), 1u);
    EXPECT_EQ(harness.runner.coverage_runs, 2);
    EXPECT_DOUBLE_EQ(report.final_coverage, 85.0);
}

TEST(GenerationLoopTest, test_respects_iteration_limit) {
    TempProject project("generation_limit");
    GenerationHarness harness(project);
    harness.config.max_iterations = 1;
    harness.runner.queue_coverage(cobertura({13, 14, 15, 16}));
    harness.runner.queue_coverage(cobertura({14, 15, 16}));
    harness.client.reply(kGeneratedTest);
    harness.client.reply(kGeneratedTest);

    auto report = harness.run();
    EXPECT_EQ(report.stopped_reason, "iteration limit reached");
    EXPECT_EQ(report.iterations.size(), 1u);
    EXPECT_DOUBLE_EQ(report.initial_coverage, 80.0);
    EXPECT_DOUBLE_EQ(report.final_coverage, 85.0);
}

TEST(GenerationLoopTest, test_unusable_model_output_stops_generation) {
    TempProject project("generation_bad_output");
    GenerationHarness harness(project);
    harness.runner.queue_coverage(cobertura({14, 15, 16}));
    harness.client.reply("```python\ndef broken(:\n```\n");
    harness.client.fail("model offline");

    auto report = harness.run();
    EXPECT_EQ(report.stopped_reason, "no test files generated");
    ASSERT_EQ(report.iterations.size(), 1u);
    EXPECT_TRUE(report.iterations[0].files.empty());
    EXPECT_EQ(harness.runner.coverage_runs, 1);
}

TEST(GenerationLoopTest, test_coverage_failure_is_reported) {
    TempProject project("generation_no_coverage");
    GenerationHarness harness(project);

    auto report = harness.run();
    EXPECT_EQ(report.stopped_reason, "no scripted coverage left");
    EXPECT_TRUE(report.iterations.empty());
}

TEST(GenerationLoopTest, test_back_to_back_passes_keep_every_file) {
    TempProject project("generation_same_second");
    GenerationHarness harness(project);
    harness.client.reply("```python\ndef test_first():\n    assert True\n```\n");
    harness.client.reply("```python\ndef test_second():\n    assert True\n```\n");

    ContextExtractor extractor(harness.config.project_root, harness.registry);
    PatchEngine patcher(harness.registry);
    SymbolIndexer indexer(harness.registry, default_exclusion({harness.config.test_dir}));
    TestGenerator generator(harness.client, extractor, patcher, project.path("tests/generated"),
                            harness.config.max_context_bytes);
    auto targets = indexer.build(project.root()).unit_targets();
    ASSERT_FALSE(targets.empty());

    auto first = generator.generate(targets, GenerationKind::Unit, 50, {});
    auto second = generator.generate(targets, GenerationKind::Unit, 50, {});
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_NE(first[0].path, second[0].path);

    auto read_generated = [&](const std::string& path) {
        return project.read("tests/generated/" + std::filesystem::path(path).filename().string());
    };
    EXPECT_NE(read_generated(first[0].path).find("def test_first"), std::string::npos);
    EXPECT_NE(read_generated(second[0].path).find("def test_second"), std::string::npos);
}

TEST(GenerationLoopTest, test_unchanged_sources_are_not_regenerated) {
    TempProject project("generation_incremental");
    std::vector<std::string> first_files;
    {
        GenerationHarness harness(project);
        harness.runner.queue_coverage(cobertura({14, 15, 16}));
        harness.runner.queue_coverage(cobertura({}));
        harness.client.reply(kGeneratedTest);
        harness.client.reply(kGeneratedTest);
        first_files = harness.run().generated_files();
    }
    ASSERT_FALSE(first_files.empty());
    EXPECT_TRUE(project.exists("tests/generated/.change_state.json"));

    // Same sources: nothing measured, nothing asked
    {
        GenerationHarness harness(project);
        auto report = harness.run();
        EXPECT_EQ(report.stopped_reason, "no source changes");
        EXPECT_EQ(harness.runner.coverage_runs, 0);
        EXPECT_TRUE(harness.client.prompts.empty());
    }

    // Editing calc.py replaces the tests generated for it; util.py is new
    {
        GenerationHarness harness(project);
        project.write("app/calc.py", std::string(kCalc) + "\n\ndef double(n):\n    return n * 2\n");
        project.write("app/util.py", "def noop():\n    return None\n");
        harness.runner.queue_coverage(cobertura({14, 15, 16}));
        harness.runner.queue_coverage(cobertura({}));
        harness.client.reply(kGeneratedTest);
        harness.client.reply(kGeneratedTest);
        harness.config.gap_focused = false;

        auto report = harness.run();
        std::set<std::string> removed(report.removed_files.begin(), report.removed_files.end());
        EXPECT_EQ(removed, std::set<std::string>(first_files.begin(), first_files.end()));
        ASSERT_FALSE(report.generated_files().empty());
        std::string prompts;
        for (const auto& prompt : harness.client.prompts) prompts += prompt.second;
        EXPECT_NE(prompts.find("`double`"), std::string::npos);
        EXPECT_NE(prompts.find("`noop`"), std::string::npos);
    }
}

TEST(GenerationLoopTest, test_force_regenerates_unchanged_sources) {
    TempProject project("generation_force");
    {
        GenerationHarness harness(project);
        harness.runner.queue_coverage(cobertura({14, 15, 16}));
        harness.runner.queue_coverage(cobertura({}));
        harness.client.reply(kGeneratedTest);
        harness.client.reply(kGeneratedTest);
        harness.run();
    }

    GenerationHarness harness(project);
    harness.config.force_generation = true;
    harness.runner.queue_coverage(cobertura({14, 15, 16}));
    harness.runner.queue_coverage(cobertura({}));
    harness.client.reply(kGeneratedTest);
    harness.client.reply(kGeneratedTest);

    auto report = harness.run();
    EXPECT_EQ(report.stopped_reason, "coverage target reached");
    EXPECT_FALSE(report.removed_files.empty());
    EXPECT_FALSE(report.generated_files().empty());
}
