#pragma once
#ifndef TESTFORGE_MODULE_RESOLVER_H
#define TESTFORGE_MODULE_RESOLVER_H

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "frontend/language_frontend.h"

namespace testforge {

struct ResolvedModule {
    std::string file;           // root-relative
    std::string attribute;      // set when the last component named something inside `file`
};

// Maps dotted module identifiers to files under a project root
class ModuleResolver {
public:
    ModuleResolver(std::filesystem::path root, const LanguageFrontend& frontend,
                   const std::vector<std::string>& extra_external = {});

    // Standard-library or third-party namespace
    bool is_external(const std::string& module) const;

    // ".models" from "pkg/tests/test_x.py" -> "pkg.tests.models"
    std::string absolute_module(const std::string& module, const std::string& importing_file) const;

    // Tries the module itself, then its parent module
    std::optional<ResolvedModule> resolve(const std::string& module,
                                          const std::string& importing_file = "") const;

    std::vector<std::string> candidate_paths(const std::string& module) const;

private:
    std::filesystem::path root_;
    std::string extension_;
    std::string index_file_;
    std::set<std::string> external_;
};

}  // namespace testforge

#endif  // TESTFORGE_MODULE_RESOLVER_H
