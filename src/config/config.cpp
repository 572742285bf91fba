#include "config/config.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace testforge {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

constexpr int kMaxModelRetries = 10;

// Values outside [min_value, max_value] keep the default
template <typename T>
void read_number(const char* name, T& out, T min_value, T max_value = std::numeric_limits<T>::max()) {
    const char* value = env(name);
    if (!value) return;
    try {
        size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used != std::string(value).size() || parsed < static_cast<long long>(min_value)) {
            throw std::invalid_argument(value);
        }
        if (parsed > 0 && static_cast<unsigned long long>(parsed) > static_cast<unsigned long long>(max_value)) {
            throw std::out_of_range(value);
        }
        out = static_cast<T>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("Ignoring invalid {}='{}', keeping {}", name, value, out);
    }
}

std::optional<double> parse_double(const char* name) {
    const char* value = env(name);
    if (!value) return std::nullopt;
    try {
        size_t used = 0;
        double parsed = std::stod(value, &used);
        if (used == std::string(value).size()) {
            return parsed;
        }
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring invalid {}='{}': {}", name, value, e.what());
        return std::nullopt;
    }
    spdlog::warn("Ignoring invalid {}='{}'", name, value);
    return std::nullopt;
}

void read_double(const char* name, double& out) {
    if (auto parsed = parse_double(name)) {
        out = *parsed;
    }
}

void read_bool(const char* name, bool& out) {
    const char* value = env(name);
    if (!value) return;
    std::string text(value);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        out = true;
    } else if (text == "0" || text == "false" || text == "no" || text == "off") {
        out = false;
    } else {
        spdlog::warn("Ignoring invalid {}='{}', keeping {}", name, value, out);
    }
}

void read_string(const char* name, std::string& out) {
    if (const char* value = env(name)) {
        out = value;
    }
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

}  // namespace

Config& get_config() {
    static Config cfg = Config::from_env();
    return cfg;
}

Config Config::from_env() {
    Config cfg;

    read_string("TESTFORGE_PROJECT_ROOT", cfg.project_root);
    read_string("TESTFORGE_TEST_DIR", cfg.test_dir);
    read_string("TESTFORGE_GENERATED_DIR", cfg.generated_dir);
    read_number("TESTFORGE_MAX_ITERATIONS", cfg.max_iterations, 1);
    read_number("TESTFORGE_FIX_ATTEMPTS", cfg.fix_attempts, 1);
    read_bool("TESTFORGE_VERIFY_FIXES", cfg.verify_fixes);

    read_number<size_t>("TESTFORGE_UNIT_BATCH", cfg.unit_batch, 1);
    read_number<size_t>("TESTFORGE_INTEG_BATCH", cfg.integration_batch, 1);
    read_number<size_t>("TESTFORGE_E2E_BATCH", cfg.e2e_batch, 1);
    read_number<size_t>("TESTFORGE_MAX_CONTEXT_BYTES", cfg.max_context_bytes, 1);
    read_double("TESTFORGE_COVERAGE_TARGET", cfg.coverage_target);
    read_bool("TESTFORGE_GAP_FOCUSED", cfg.gap_focused);
    read_bool("TESTFORGE_INCREMENTAL", cfg.incremental);
    read_bool("TESTFORGE_FORCE_GENERATION", cfg.force_generation);

    read_string("TESTFORGE_TEST_COMMAND", cfg.test_command);
    read_string("TESTFORGE_COVERAGE_SOURCE", cfg.coverage_source);
    read_number("TESTFORGE_RUN_TIMEOUT_SECS", cfg.run_timeout_secs, 1);

    read_string("TESTFORGE_MODEL_URL", cfg.model_url);
    read_string("TESTFORGE_MODEL_NAME", cfg.model_name);
    read_string("TESTFORGE_MODEL_API_KEY", cfg.model_api_key);
    cfg.model_temperature = parse_double("TESTFORGE_MODEL_TEMPERATURE");
    read_number("TESTFORGE_MODEL_TIMEOUT_SECS", cfg.model_timeout_secs, 1);
    read_number("TESTFORGE_MODEL_RETRIES", cfg.model_retries, 1, kMaxModelRetries);

    read_string("TESTFORGE_REPORT_PATH", cfg.report_path);
    if (const char* modules = env("TESTFORGE_EXTERNAL_MODULES")) {
        cfg.external_modules = split_list(modules);
    }
    read_string("TESTFORGE_LOG_LEVEL", cfg.log_level);

    return cfg;
}

}  // namespace testforge
