#pragma once
#ifndef TESTFORGE_CONFIG_H
#define TESTFORGE_CONFIG_H

#include <optional>
#include <string>
#include <vector>

namespace testforge {

struct Config {
    // Run control
    std::string project_root = ".";
    std::string test_dir = "tests";
    std::string generated_dir = "tests/generated";
    int max_iterations = 3;
    int fix_attempts = 3;
    bool verify_fixes = true;

    // Generation
    size_t unit_batch = 50;
    size_t integration_batch = 30;
    size_t e2e_batch = 20;
    size_t max_context_bytes = 120000;
    double coverage_target = 90.0;  // percent
    bool gap_focused = true;
    bool incremental = true;        // only regenerate for sources changed since the last run
    bool force_generation = false;  // treat every source as changed

    // Test runner
    std::string test_command = "python -m pytest";
    std::string coverage_source = ".";
    int run_timeout_secs = 600;

    // Generative model
    std::string model_url = "http://localhost:11434/api/chat";
    std::string model_name = "llama3";
    std::string model_api_key;
    std::optional<double> model_temperature;
    int model_timeout_secs = 300;
    int model_retries = 3;

    std::string report_path = "testforge_report.json";
    std::vector<std::string> external_modules;
    std::string log_level = "info";

    // TESTFORGE_MODEL_URL=none runs the repair loop on rules alone
    bool model_enabled() const { return model_url != "none"; }

    // Malformed values keep the default and log a warning
    static Config from_env();
};

Config& get_config();

}  // namespace testforge

#endif  // TESTFORGE_CONFIG_H
