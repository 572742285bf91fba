#include "patch/patch_engine.h"
#include "core/errors.h"
#include "core/text_file.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>
#include <set>
#include <sstream>

namespace testforge {

namespace {

std::vector<std::string> split_plain(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

std::string leading_whitespace(const std::string& line) {
    return line.substr(0, line.find_first_not_of(" \t"));
}

int paren_balance(const std::string& line) {
    int balance = 0;
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == '\\') ++i;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') quote = c;
        else if (c == '#') break;
        else if (c == '(' || c == '[' || c == '{') ++balance;
        else if (c == ')' || c == ']' || c == '}') --balance;
    }
    return balance;
}

}  // namespace

PatchEngine::PatchEngine(const FrontendRegistry& registry) : registry_(registry) {}

std::string PatchEngine::normalize_replacement(const std::string& text, const std::string& indent) {
    auto lines = split_plain(text);
    while (!lines.empty() && is_blank(lines.front())) lines.erase(lines.begin());
    while (!lines.empty() && is_blank(lines.back())) lines.pop_back();

    size_t common = std::string::npos;
    for (const auto& line : lines) {
        if (is_blank(line)) continue;
        common = std::min(common, line.find_first_not_of(" \t"));
    }
    if (common == std::string::npos) common = 0;

    std::string out;
    for (const auto& line : lines) {
        if (!is_blank(line)) {
            out += indent + line.substr(common);
        }
        out += '\n';
    }
    return out;
}

std::string PatchEngine::collapse_parametrize(const std::string& text) {
    static const std::regex kParametrize(R"(^\s*@pytest\.mark\.parametrize\(\s*(['"])([^'"]*)\1)");

    auto lines = split_lines_keep_ends(text);
    std::set<std::string> seen;
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch m;
        if (!std::regex_search(lines[i], m, kParametrize)) {
            out += lines[i];
            continue;
        }
        std::string argnames = std::regex_replace(m[2].str(), std::regex(R"(\s+)"), "");
        if (seen.insert(argnames).second) {
            out += lines[i];
            continue;
        }
        // Drop the duplicate decorator, including its continuation lines
        int balance = paren_balance(lines[i]);
        while (balance > 0 && i + 1 < lines.size()) {
            ++i;
            balance += paren_balance(lines[i]);
        }
        spdlog::debug("Dropped duplicate parametrize decorator for '{}'", argnames);
    }
    return out;
}

FileSnapshot PatchEngine::snapshot(const std::filesystem::path& file) const {
    FileSnapshot snap;
    snap.path = file;
    std::error_code ec;
    snap.existed = std::filesystem::exists(file, ec);
    if (snap.existed) {
        snap.content = read_text_file(file);
    }
    return snap;
}

void PatchEngine::restore(const FileSnapshot& snapshot) const {
    try {
        if (snapshot.existed) {
            write_text_file(snapshot.path, snapshot.content);
        } else {
            std::filesystem::remove(snapshot.path);
        }
    } catch (const std::exception& e) {
        throw PatchError("cannot restore " + snapshot.path.string() + ": " + e.what());
    }
}

PatchOutcome PatchEngine::replace_definition(const std::filesystem::path& file,
                                             const std::string& qualified_name,
                                             const std::string& replacement) const {
    PatchOutcome outcome;
    outcome.target = qualified_name;
    outcome.file = file.string();

    const LanguageFrontend* frontend = registry_.for_path(file);
    if (!frontend) {
        outcome.reason = "no language front end for " + file.string();
        return outcome;
    }

    FileSnapshot original;
    std::unique_ptr<ParsedFile> parsed;
    try {
        original = snapshot(file);
        parsed = frontend->parse_file(file.string(), original.content);
    } catch (const ParseError& e) {
        outcome.reason = std::string("file does not parse before patching: ") + e.what();
        return outcome;
    } catch (const Error& e) {
        outcome.reason = e.what();
        return outcome;
    }

    auto def = frontend->find_definition(*parsed, qualified_name);
    if (!def) {
        outcome.reason = "definition '" + qualified_name + "' not found";
        return outcome;
    }

    auto lines = split_lines_keep_ends(original.content);
    const LineRange& range = def->outer_range;
    if (range.empty() || range.last_line() > static_cast<int>(lines.size())) {
        outcome.reason = "definition range " + range.to_string() + " is outside the file";
        return outcome;
    }

    std::string indent = leading_whitespace(lines[range.begin - 1]);
    std::string block = normalize_replacement(collapse_parametrize(replacement), indent);
    if (block.empty()) {
        outcome.reason = "replacement is empty";
        return outcome;
    }

    std::string patched;
    for (int i = 0; i < range.begin - 1; ++i) patched += lines[i];
    patched += block;
    for (size_t i = static_cast<size_t>(range.end - 1); i < lines.size(); ++i) patched += lines[i];

    try {
        write_text_file(file, patched);
        outcome.applied = true;
        if (!frontend->is_valid(read_text_file(file))) {
            restore(original);
            outcome.reason = "patched file does not parse; original restored";
            spdlog::warn("Patch of {} in {} rejected: result does not parse", qualified_name, file.string());
            return outcome;
        }
    } catch (const PatchError&) {
        throw;
    } catch (const Error& e) {
        restore(original);
        throw PatchError("writing patch to " + file.string() + " failed: " + e.what());
    }

    outcome.validated = true;
    outcome.reason = "replaced lines " + range.to_string() + " with " +
                     std::to_string(split_lines_keep_ends(block).size()) + " lines";
    spdlog::info("Patched {} in {}: {}", qualified_name, file.string(), outcome.reason);
    return outcome;
}

PatchOutcome PatchEngine::write_new_file(const std::filesystem::path& file, const std::string& content) const {
    PatchOutcome outcome;
    outcome.target = file.filename().string();
    outcome.file = file.string();

    const LanguageFrontend* frontend = registry_.for_path(file);
    if (!frontend) {
        outcome.reason = "no language front end for " + file.string();
        return outcome;
    }
    if (!frontend->is_valid(content)) {
        outcome.reason = "generated content does not parse; nothing written";
        return outcome;
    }
    std::error_code ec;
    if (std::filesystem::exists(file, ec)) {
        outcome.reason = file.string() + " already exists; nothing written";
        return outcome;
    }
    try {
        write_text_file(file, content);
    } catch (const Error& e) {
        throw PatchError(std::string("cannot write ") + file.string() + ": " + e.what());
    }
    outcome.applied = true;
    outcome.validated = true;
    outcome.reason = "written";
    return outcome;
}

}  // namespace testforge
