#pragma once
#ifndef TESTFORGE_CHANGE_STATE_H
#define TESTFORGE_CHANGE_STATE_H

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "config/config.h"

namespace testforge {

struct ChangeSet {
    std::set<std::string> changed;  // new or modified sources
    std::set<std::string> deleted;

    bool empty() const { return changed.empty() && deleted.empty(); }
};

// Source hashes as of the last generation run, and the test files generated for each source
class ChangeState {
public:
    // A missing file is an empty state; a malformed one is logged and treated as empty
    static ChangeState load(const std::filesystem::path& path);
    // Throws ReportError
    void save(const std::filesystem::path& path) const;

    ChangeSet diff(const std::map<std::string, std::string>& current) const;

    const std::map<std::string, std::string>& hashes() const { return hashes_; }
    void set_hashes(std::map<std::string, std::string> hashes) { hashes_ = std::move(hashes); }

    // Generated file names, relative to the generated-tests directory
    std::vector<std::string> tests_for(const std::string& source) const;
    void set_tests(const std::string& source, std::vector<std::string> tests);
    void forget(const std::string& source) { tests_.erase(source); }

private:
    std::map<std::string, std::string> hashes_;
    std::map<std::string, std::vector<std::string>> tests_;
};

// <project_root>/<generated_dir>/.change_state.json
std::filesystem::path change_state_path(const Config& config);

// CRC-32 of the content as 8 hex digits
std::string content_hash(const std::string& content);

// Root-relative path -> content hash; unreadable files are logged and left out
std::map<std::string, std::string> hash_sources(const std::filesystem::path& root,
                                                const std::vector<std::string>& files);

}  // namespace testforge

#endif  // TESTFORGE_CHANGE_STATE_H
