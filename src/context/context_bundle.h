#pragma once
#ifndef TESTFORGE_CONTEXT_BUNDLE_H
#define TESTFORGE_CONTEXT_BUNDLE_H

#include <map>
#include <set>
#include <string>
#include <vector>

namespace testforge {

// Source needed to fix or generate tests for a set of targets.
// `files` always holds complete file text.
struct ContextBundle {
    std::set<std::string> target_names;
    std::map<std::string, std::string> files;
    std::map<std::string, std::string> excerpts;    // referenced top-level definitions per file
    std::vector<std::string> unresolved;            // modules that mapped to no file

    bool empty() const { return files.empty(); }
    size_t total_bytes() const;

    // "# FILE: <path>" sections in path order; whole sections only, unless none fits
    std::string render(size_t max_bytes) const;
};

}  // namespace testforge

#endif  // TESTFORGE_CONTEXT_BUNDLE_H
