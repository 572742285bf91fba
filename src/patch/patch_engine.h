#pragma once
#ifndef TESTFORGE_PATCH_ENGINE_H
#define TESTFORGE_PATCH_ENGINE_H

#include <filesystem>
#include <string>
#include "frontend/frontend_registry.h"

namespace testforge {

struct PatchOutcome {
    std::string target;
    std::string file;
    bool applied = false;
    bool validated = false;
    std::string reason;

    bool succeeded() const { return applied && validated; }
};

// Byte-exact copy of a file taken before it is modified
struct FileSnapshot {
    std::filesystem::path path;
    std::string content;
    bool existed = false;
};

// Replaces one definition in place. A file that parsed before a patch still parses
// afterwards, or is restored byte for byte.
class PatchEngine {
public:
    explicit PatchEngine(const FrontendRegistry& registry);

    // Throws PatchError when a write fails; the original content is restored first
    PatchOutcome replace_definition(const std::filesystem::path& file, const std::string& qualified_name,
                                    const std::string& replacement) const;

    // Never writes content that does not parse, never overwrites an existing file
    PatchOutcome write_new_file(const std::filesystem::path& file, const std::string& content) const;

    FileSnapshot snapshot(const std::filesystem::path& file) const;
    void restore(const FileSnapshot& snapshot) const;

    // Re-indents the block so its least-indented line starts with `indent`
    static std::string normalize_replacement(const std::string& text, const std::string& indent);

    // Keeps the first of several @pytest.mark.parametrize decorators with the same argnames
    static std::string collapse_parametrize(const std::string& text);

private:
    const FrontendRegistry& registry_;
};

}  // namespace testforge

#endif  // TESTFORGE_PATCH_ENGINE_H
