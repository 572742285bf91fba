#include "context/context_extractor.h"
#include "context/module_resolver.h"
#include "core/errors.h"
#include "core/text_file.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>

namespace testforge {

namespace {

void note_unresolved(ContextBundle& bundle, const std::string& module) {
    if (std::find(bundle.unresolved.begin(), bundle.unresolved.end(), module) == bundle.unresolved.end()) {
        bundle.unresolved.push_back(module);
    }
}

}  // namespace

ContextExtractor::ContextExtractor(std::filesystem::path root, const FrontendRegistry& registry,
                                   std::vector<std::string> extra_external)
    : root_(std::move(root)), registry_(registry), extra_external_(std::move(extra_external)) {}

ContextBundle ContextExtractor::for_failure(const TestFailure& failure) const {
    ContextBundle bundle;
    bundle.target_names.insert(failure.qualified_name());

    const LanguageFrontend* frontend = registry_.for_path(failure.test_file);
    if (!frontend) {
        spdlog::warn("No language front end for {}", failure.test_file);
        return bundle;
    }

    std::unique_ptr<ParsedFile> parsed;
    try {
        parsed = frontend->parse_file(failure.test_file, read_text_file(root_ / failure.test_file));
    } catch (const Error& e) {
        spdlog::warn("Cannot analyse test file {}: {}", failure.test_file, e.what());
        return bundle;
    }

    auto def = frontend->find_definition(*parsed, failure.qualified_name());
    std::set<std::string> referenced;
    if (def) {
        referenced = frontend->referenced_names(*parsed, *def);
    } else {
        spdlog::debug("{} not found in {}, using every import", failure.qualified_name(),
                      failure.test_file);
    }

    ModuleResolver resolver(root_, *frontend, extra_external_);
    std::map<std::string, std::set<std::string>> wanted;
    std::set<std::string> whole_modules;

    for (const auto& binding : frontend->extract_imports(*parsed)) {
        // Imports and patch targets written inside the test count as referenced
        bool inside = def && def->outer_range.contains(binding.line);
        if (def && !inside && referenced.count(binding.bound_name) == 0) continue;

        std::string module = resolver.absolute_module(binding.module_path, failure.test_file);
        if (module.empty() || resolver.is_external(module)) continue;

        auto resolved = resolver.resolve(module);
        if (!resolved) {
            note_unresolved(bundle, module);
            continue;
        }
        if (resolved->file == failure.test_file) continue;

        auto& names = wanted[resolved->file];
        if (!resolved->attribute.empty()) {
            names.insert(resolved->attribute);
            continue;
        }
        // module.Thing references name what the test needs from the module
        std::string prefix = binding.bound_name + ".";
        bool any = false;
        for (const auto& ref : referenced) {
            if (ref.compare(0, prefix.size(), prefix) != 0) continue;
            std::string rest = ref.substr(prefix.size());
            names.insert(rest.substr(0, rest.find('.')));
            any = true;
        }
        if (!any) whole_modules.insert(resolved->file);
    }

    for (const auto& [file, names] : wanted) {
        try {
            bundle.files[file] = read_text_file(root_ / file);
        } catch (const Error& e) {
            spdlog::warn("Cannot read context file {}: {}", file, e.what());
            continue;
        }
        const LanguageFrontend* file_frontend = registry_.for_path(file);
        if (file_frontend) {
            add_excerpt(bundle, *file_frontend, file,
                        whole_modules.count(file) ? std::set<std::string>{} : names);
        }
    }

    spdlog::debug("Context for {}: {} files, {} unresolved modules", failure.node_id,
                  bundle.files.size(), bundle.unresolved.size());
    return bundle;
}

void ContextExtractor::add_excerpt(ContextBundle& bundle, const LanguageFrontend& frontend,
                                   const std::string& file, const std::set<std::string>& wanted) const {
    const std::string& source = bundle.files.at(file);
    std::unique_ptr<ParsedFile> parsed;
    try {
        parsed = frontend.parse_file(file, source);
    } catch (const ParseError& e) {
        spdlog::debug("No excerpt for {}: {}", file, e.what());
        return;
    }

    auto top = frontend.top_level_definitions(*parsed);
    std::map<std::string, const Definition*> by_name;
    for (const auto& d : top) {
        by_name[d.name] = &d;
    }

    std::set<std::string> selected;
    if (wanted.empty()) {
        for (const auto& d : top) selected.insert(d.name);
    } else {
        std::set<std::string> frontier;
        for (const auto& name : wanted) {
            if (by_name.count(name)) frontier.insert(name);
        }
        selected = frontier;
        for (int depth = 0; depth < kDependencyDepth && !frontier.empty(); ++depth) {
            std::set<std::string> next;
            for (const auto& name : frontier) {
                for (const auto& ref : frontend.referenced_names(*parsed, *by_name[name])) {
                    if (by_name.count(ref) && selected.insert(ref).second) {
                        next.insert(ref);
                    }
                }
            }
            frontier = std::move(next);
        }
    }
    if (selected.empty()) return;

    std::string excerpt;
    for (const auto& d : top) {
        if (selected.count(d.name) == 0) continue;
        if (!excerpt.empty()) excerpt += "\n";
        excerpt += slice_lines(source, d.outer_range);
    }
    bundle.excerpts[file] = std::move(excerpt);
}

ContextBundle ContextExtractor::for_targets(const std::vector<Symbol>& targets) const {
    ContextBundle bundle;
    for (const auto& target : targets) {
        bundle.target_names.insert(target.qualified_name);
        if (bundle.files.count(target.file)) continue;
        try {
            bundle.files[target.file] = read_text_file(root_ / target.file);
        } catch (const Error& e) {
            spdlog::warn("Cannot read {} for {}: {}", target.file, target.qualified_name, e.what());
            note_unresolved(bundle, target.file);
        }
    }
    return bundle;
}

ContextBundle ContextExtractor::for_names(const SymbolIndex& index,
                                          const std::vector<std::string>& names) const {
    std::vector<Symbol> targets;
    std::vector<std::string> missing;
    for (const auto& name : names) {
        auto matches = index.find_by_name(name);
        if (matches.empty()) {
            missing.push_back(name);
            continue;
        }
        std::set<std::string> files;
        for (const auto& m : matches) files.insert(m.file);
        if (files.size() > 1) {
            spdlog::warn("'{}' is defined in {} files, including all of them", name, files.size());
        }
        targets.insert(targets.end(), matches.begin(), matches.end());
    }

    ContextBundle bundle = for_targets(targets);
    for (const auto& name : missing) {
        spdlog::debug("No indexed symbol named '{}'", name);
        bundle.target_names.insert(name);
        note_unresolved(bundle, name);
    }
    return bundle;
}

std::optional<std::string> ContextExtractor::test_source(const TestFailure& failure) const {
    const LanguageFrontend* frontend = registry_.for_path(failure.test_file);
    if (!frontend) return std::nullopt;
    try {
        auto parsed = frontend->parse_file(failure.test_file, read_text_file(root_ / failure.test_file));
        auto def = frontend->find_definition(*parsed, failure.qualified_name());
        if (!def) return std::nullopt;
        return slice_lines(parsed->source(), def->outer_range);
    } catch (const Error& e) {
        spdlog::warn("Cannot read test {}: {}", failure.node_id, e.what());
        return std::nullopt;
    }
}

}  // namespace testforge
