#pragma once
#ifndef TESTFORGE_FRONTEND_REGISTRY_H
#define TESTFORGE_FRONTEND_REGISTRY_H

#include <filesystem>
#include <memory>
#include <vector>
#include "frontend/language_frontend.h"

namespace testforge {

// Chooses the language front end for a file by its extension
class FrontendRegistry {
public:
    FrontendRegistry() = default;

    void add(std::unique_ptr<LanguageFrontend> frontend);

    // nullptr when no registered front end handles the file
    const LanguageFrontend* for_path(const std::filesystem::path& file) const;

    const std::vector<std::unique_ptr<LanguageFrontend>>& frontends() const { return frontends_; }

    // Registry with every built-in front end
    static FrontendRegistry with_defaults();

private:
    std::vector<std::unique_ptr<LanguageFrontend>> frontends_;
};

}  // namespace testforge

#endif  // TESTFORGE_FRONTEND_REGISTRY_H
