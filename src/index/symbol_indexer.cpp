#include "index/symbol_indexer.h"
#include "core/errors.h"
#include "core/text_file.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace testforge {

namespace {

const std::set<std::string> kExcludedDirs = {
    ".git", ".hg", ".svn", "__pycache__", ".pytest_cache", ".mypy_cache", ".tox",
    "venv", ".venv", "env", "node_modules", "build", "dist", ".eggs", "htmlcov",
    "tests", "test",
};

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

ExclusionPredicate default_exclusion(const std::vector<std::string>& extra_dirs) {
    std::set<std::string> dirs = kExcludedDirs;
    dirs.insert(extra_dirs.begin(), extra_dirs.end());

    return [dirs](const std::filesystem::path& relative, bool is_directory) {
        std::string name = relative.filename().string();
        if (is_directory) {
            return dirs.count(name) > 0 || ends_with(name, ".egg-info");
        }
        return name == "conftest.py" || name.rfind("test_", 0) == 0 || ends_with(name, "_test.py");
    };
}

SymbolIndexer::SymbolIndexer(const FrontendRegistry& registry, ExclusionPredicate exclude)
    : registry_(registry), exclude_(std::move(exclude)) {}

std::vector<std::string> SymbolIndexer::discover(const std::filesystem::path& root) const {
    namespace fs = std::filesystem;
    std::vector<std::string> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::error("Cannot walk {}: {}", root.string(), ec.message());
        return files;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Directory walk error under {}: {}", root.string(), ec.message());
            ec.clear();
            continue;
        }
        fs::path relative = it->path().lexically_relative(root);
        bool is_dir = it->is_directory(ec);
        if (is_dir) {
            if (exclude_(relative, true)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec) || exclude_(relative, false)) continue;
        if (!registry_.for_path(relative)) continue;
        files.push_back(relative.generic_string());
    }

    std::sort(files.begin(), files.end());
    return files;
}

SymbolIndex SymbolIndexer::build(const std::filesystem::path& root) const {
    SymbolIndex index;
    for (const auto& relative : discover(root)) {
        index_file(root, relative, index);
    }
    spdlog::info("Indexed {} symbols and {} routes in {} files ({} skipped)",
                 index.size(), index.routes().size(), index.files().size(),
                 index.skipped_files().size());
    return index;
}

void SymbolIndexer::index_file(const std::filesystem::path& root, const std::string& relative,
                               SymbolIndex& index) const {
    const LanguageFrontend* frontend = registry_.for_path(relative);
    if (!frontend) return;

    try {
        std::string source = read_text_file(root / relative);
        auto parsed = frontend->parse_file(relative, source);
        index.add_file(relative, frontend->extract_symbols(*parsed), frontend->extract_routes(*parsed));
    } catch (const ParseError& e) {
        spdlog::warn("Skipping unparsable file {}", e.what());
        index.add_skipped(relative, e.what());
    } catch (const Error& e) {
        spdlog::warn("Skipping unreadable file {}: {}", relative, e.what());
        index.add_skipped(relative, e.what());
    }
}

}  // namespace testforge
