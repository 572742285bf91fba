#include "context/context_bundle.h"
#include <spdlog/spdlog.h>

namespace testforge {

namespace {

const char kTruncationMarker[] = "# ... truncated ...\n";

}  // namespace

size_t ContextBundle::total_bytes() const {
    size_t total = 0;
    for (const auto& [path, text] : files) {
        total += text.size();
    }
    return total;
}

std::string ContextBundle::render(size_t max_bytes) const {
    std::vector<std::string> sections;
    for (const auto& [path, text] : files) {
        auto excerpt = excerpts.find(path);
        const std::string& body = excerpt != excerpts.end() ? excerpt->second : text;
        std::string section = "# FILE: " + path + "\n" + body;
        if (!section.empty() && section.back() != '\n') section += '\n';
        section += '\n';
        sections.push_back(std::move(section));
    }
    if (sections.empty()) return {};

    std::string out;
    size_t skipped = 0;
    for (const auto& section : sections) {
        if (out.size() + section.size() <= max_bytes) {
            out += section;
        } else {
            ++skipped;
        }
    }
    if (!out.empty()) {
        if (skipped > 0) {
            spdlog::info("Context over {} bytes, dropped {} of {} files", max_bytes, skipped,
                         sections.size());
        }
        return out;
    }

    // Not even one file fits: keep the head of the first one, cut at a line boundary
    size_t marker = sizeof(kTruncationMarker) - 1;
    size_t budget = max_bytes > marker ? max_bytes - marker : 0;
    std::string head = sections.front().substr(0, budget);
    size_t last_newline = head.rfind('\n');
    head = last_newline == std::string::npos ? std::string() : head.substr(0, last_newline + 1);
    spdlog::warn("Context file larger than {} bytes, truncating", max_bytes);
    return head + kTruncationMarker;
}

}  // namespace testforge
