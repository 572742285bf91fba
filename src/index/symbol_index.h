#pragma once
#ifndef TESTFORGE_SYMBOL_INDEX_H
#define TESTFORGE_SYMBOL_INDEX_H

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/types.h"

namespace testforge {

struct SkippedFile {
    std::string path;
    std::string reason;
};

// Symbol table for one pass over a project. Rebuilt from scratch every pass.
class SymbolIndex {
public:
    SymbolIndex() = default;

    void add_file(const std::string& file, std::vector<Symbol> symbols, std::vector<Route> routes);
    void add_skipped(const std::string& file, const std::string& reason);

    // Discovery order: file path order, then definition order within a file
    const std::vector<Symbol>& symbols() const { return symbols_; }
    const std::vector<Route>& routes() const { return routes_; }
    const std::vector<std::string>& files() const { return files_; }
    const std::vector<SkippedFile>& skipped_files() const { return skipped_; }

    std::optional<Symbol> find(const SymbolKey& key) const;

    // Every symbol whose name or qualified name matches, across all files
    std::vector<Symbol> find_by_name(const std::string& name) const;

    std::vector<Symbol> symbols_in(const std::string& file) const;

    // Files holding the targets, in order of first appearance
    std::vector<std::string> files_for(const std::vector<Symbol>& targets) const;

    // Module-level functions and classes
    std::vector<Symbol> unit_targets() const;
    std::vector<Symbol> route_targets() const;

    size_t size() const { return symbols_.size(); }
    bool empty() const { return symbols_.empty(); }

private:
    std::vector<Symbol> symbols_;
    std::vector<Route> routes_;
    std::vector<std::string> files_;
    std::vector<SkippedFile> skipped_;
    std::map<SymbolKey, size_t> by_key_;
};

}  // namespace testforge

#endif  // TESTFORGE_SYMBOL_INDEX_H
