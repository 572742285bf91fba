#pragma once
#ifndef TESTFORGE_CONTEXT_EXTRACTOR_H
#define TESTFORGE_CONTEXT_EXTRACTOR_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "context/context_bundle.h"
#include "core/types.h"
#include "frontend/frontend_registry.h"
#include "index/symbol_index.h"
#include "runner/test_report.h"

namespace testforge {

class ContextExtractor {
public:
    ContextExtractor(std::filesystem::path root, const FrontendRegistry& registry,
                     std::vector<std::string> extra_external = {});

    // Files imported by the failing test and actually referenced in its body
    ContextBundle for_failure(const TestFailure& failure) const;

    // Whole files holding the targets
    ContextBundle for_targets(const std::vector<Symbol>& targets) const;

    // Every file defining one of the names; ambiguous names pull in all their files
    ContextBundle for_names(const SymbolIndex& index, const std::vector<std::string>& names) const;

    // Text of the failing test's definition, decorators included
    std::optional<std::string> test_source(const TestFailure& failure) const;

    // Closure depth for definitions pulled in through references
    static constexpr int kDependencyDepth = 3;

private:
    void add_excerpt(ContextBundle& bundle, const LanguageFrontend& frontend,
                     const std::string& file, const std::set<std::string>& wanted) const;

    std::filesystem::path root_;
    const FrontendRegistry& registry_;
    std::vector<std::string> extra_external_;
};

}  // namespace testforge

#endif  // TESTFORGE_CONTEXT_EXTRACTOR_H
