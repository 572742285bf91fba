#include "runner/command_test_runner.h"
#include "core/errors.h"
#include <boost/process.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace testforge {

namespace bp = boost::process;

namespace {

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream in(command);
    std::string part;
    while (in >> part) {
        parts.push_back(part);
    }
    return parts;
}

void remove_stale(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::warn("Could not remove stale {}: {}", path.string(), ec.message());
    }
}

}  // namespace

CommandTestRunner::CommandTestRunner(const Config& config)
    : root_(std::filesystem::absolute(config.project_root)),
      test_dir_(config.test_dir),
      command_(split_command(config.test_command)),
      coverage_source_(config.coverage_source),
      timeout_(config.run_timeout_secs),
      work_dir_(root_ / ".testforge") {
    if (command_.empty()) {
        throw std::invalid_argument("test command is empty");
    }
}

int CommandTestRunner::execute(const std::vector<std::string>& extra_args, const std::string& label) {
    std::error_code ec;
    std::filesystem::create_directories(work_dir_, ec);
    if (ec) {
        throw ReportError("cannot create " + work_dir_.string() + ": " + ec.message());
    }

    boost::filesystem::path program = command_.front();
    if (command_.front().find('/') == std::string::npos) {
        program = bp::search_path(command_.front());
        if (program.empty()) {
            throw ReportError("test command not found on PATH: " + command_.front());
        }
    }

    std::vector<std::string> args(command_.begin() + 1, command_.end());
    args.insert(args.end(), extra_args.begin(), extra_args.end());
    std::string log_path = (work_dir_ / (label + ".log")).string();

    spdlog::debug("Running {} with {} arguments in {}", program.string(), args.size(), root_.string());
    try {
        bp::child child(program, bp::args(args), bp::start_dir(root_.string()),
                        (bp::std_out & bp::std_err) > log_path, bp::std_in < bp::null);
        if (!child.wait_for(timeout_)) {
            child.terminate();
            throw ReportError("test run timed out after " + std::to_string(timeout_.count()) +
                              "s (output in " + log_path + ")");
        }
        return child.exit_code();
    } catch (const bp::process_error& e) {
        throw ReportError(std::string("cannot launch test command: ") + e.what());
    }
}

TestRunReport CommandTestRunner::run(const std::vector<std::string>& selectors) {
    auto report_path = work_dir_ / "pytest_report.json";
    remove_stale(report_path);

    std::vector<std::string> args;
    if (selectors.empty()) {
        args.push_back(test_dir_);
    } else {
        args.insert(args.end(), selectors.begin(), selectors.end());
    }
    args.push_back("--tb=short");
    args.push_back("--json-report");
    args.push_back("--json-report-file=" + report_path.string());

    int code = execute(args, "pytest");
    TestRunReport report = load_pytest_json(report_path);
    if (report.exit_code != code) {
        spdlog::debug("Report exit code {} differs from process exit code {}", report.exit_code, code);
        report.exit_code = code;
    }
    spdlog::info("Test run finished: {} passed, {} failed, {} errors",
                 report.count(Outcome::Passed), report.count(Outcome::Failed),
                 report.count(Outcome::Error));
    return report;
}

std::filesystem::path CommandTestRunner::run_with_coverage() {
    auto xml_path = work_dir_ / "coverage.xml";
    remove_stale(xml_path);

    int code = execute({test_dir_, "-q", "--cov=" + coverage_source_,
                        "--cov-report=xml:" + xml_path.string()},
                       "coverage");
    if (!std::filesystem::exists(xml_path)) {
        throw ReportError("coverage run (exit code " + std::to_string(code) +
                          ") produced no " + xml_path.string());
    }
    return xml_path;
}

}  // namespace testforge
