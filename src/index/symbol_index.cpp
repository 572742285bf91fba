#include "index/symbol_index.h"
#include <set>

namespace testforge {

void SymbolIndex::add_file(const std::string& file, std::vector<Symbol> symbols,
                           std::vector<Route> routes) {
    files_.push_back(file);
    for (auto& sym : symbols) {
        by_key_.emplace(sym.key(), symbols_.size());
        symbols_.push_back(std::move(sym));
    }
    for (auto& route : routes) {
        routes_.push_back(std::move(route));
    }
}

void SymbolIndex::add_skipped(const std::string& file, const std::string& reason) {
    skipped_.push_back({file, reason});
}

std::optional<Symbol> SymbolIndex::find(const SymbolKey& key) const {
    auto it = by_key_.find(key);
    if (it == by_key_.end()) {
        return std::nullopt;
    }
    return symbols_[it->second];
}

std::vector<Symbol> SymbolIndex::find_by_name(const std::string& name) const {
    std::vector<Symbol> matches;
    for (const auto& sym : symbols_) {
        if (sym.qualified_name == name || sym.name == name) {
            matches.push_back(sym);
        }
    }
    return matches;
}

std::vector<Symbol> SymbolIndex::symbols_in(const std::string& file) const {
    std::vector<Symbol> result;
    for (const auto& sym : symbols_) {
        if (sym.file == file) {
            result.push_back(sym);
        }
    }
    return result;
}

std::vector<std::string> SymbolIndex::files_for(const std::vector<Symbol>& targets) const {
    std::vector<std::string> result;
    std::set<std::string> seen;
    for (const auto& target : targets) {
        if (seen.insert(target.file).second) {
            result.push_back(target.file);
        }
    }
    return result;
}

std::vector<Symbol> SymbolIndex::unit_targets() const {
    std::vector<Symbol> result;
    for (const auto& sym : symbols_) {
        if (sym.depth == 0 && (sym.kind == SymbolKind::Function || sym.kind == SymbolKind::Class)) {
            result.push_back(sym);
        }
    }
    return result;
}

std::vector<Symbol> SymbolIndex::route_targets() const {
    std::vector<Symbol> result;
    result.reserve(routes_.size());
    for (const auto& route : routes_) {
        result.push_back(route.as_symbol());
    }
    return result;
}

}  // namespace testforge
