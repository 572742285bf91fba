#pragma once
#ifndef TESTFORGE_COMMAND_TEST_RUNNER_H
#define TESTFORGE_COMMAND_TEST_RUNNER_H

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "config/config.h"
#include "runner/test_runner.h"

namespace testforge {

// Runs pytest as a subprocess with pytest-json-report and pytest-cov
class CommandTestRunner : public TestRunner {
public:
    explicit CommandTestRunner(const Config& config);

    TestRunReport run(const std::vector<std::string>& selectors) override;
    std::filesystem::path run_with_coverage() override;

    const std::filesystem::path& work_dir() const { return work_dir_; }

private:
    int execute(const std::vector<std::string>& extra_args, const std::string& label);

    std::filesystem::path root_;
    std::string test_dir_;
    std::vector<std::string> command_;
    std::string coverage_source_;
    std::chrono::seconds timeout_;
    std::filesystem::path work_dir_;
};

}  // namespace testforge

#endif  // TESTFORGE_COMMAND_TEST_RUNNER_H
