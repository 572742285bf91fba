#pragma once
#ifndef TESTFORGE_SYMBOL_INDEXER_H
#define TESTFORGE_SYMBOL_INDEXER_H

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "frontend/frontend_registry.h"
#include "index/symbol_index.h"

namespace testforge {

// Called with a root-relative path; true means skip it (and, for a directory, everything below)
using ExclusionPredicate =
    std::function<bool(const std::filesystem::path& relative, bool is_directory)>;

// Skips VCS metadata, caches, virtualenvs, build output, test directories and test files
ExclusionPredicate default_exclusion(const std::vector<std::string>& extra_dirs = {});

class SymbolIndexer {
public:
    SymbolIndexer(const FrontendRegistry& registry, ExclusionPredicate exclude);

    SymbolIndex build(const std::filesystem::path& root) const;

    // Relative paths of every indexable file under root, sorted
    std::vector<std::string> discover(const std::filesystem::path& root) const;

private:
    void index_file(const std::filesystem::path& root, const std::string& relative,
                    SymbolIndex& index) const;

    const FrontendRegistry& registry_;
    ExclusionPredicate exclude_;
};

}  // namespace testforge

#endif  // TESTFORGE_SYMBOL_INDEXER_H
