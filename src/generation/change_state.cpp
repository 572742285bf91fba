#include "generation/change_state.h"
#include "core/errors.h"
#include "core/text_file.h"
#include <boost/crc.hpp>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <iomanip>
#include <sstream>

namespace testforge {

ChangeState ChangeState::load(const std::filesystem::path& path) {
    ChangeState state;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return state;
    }

    Json::Value root;
    try {
        std::string text = read_text_file(path);
        Json::CharReaderBuilder builder;
        std::string errors;
        std::istringstream in(text);
        if (!Json::parseFromStream(builder, in, &root, &errors) || !root.isObject()) {
            spdlog::warn("Ignoring malformed change state {}: {}", path.string(), errors);
            return state;
        }
    } catch (const Error& e) {
        spdlog::warn("Ignoring unreadable change state {}: {}", path.string(), e.what());
        return state;
    }

    const Json::Value& sources = root["source_files"];
    if (sources.isObject()) {
        for (const auto& name : sources.getMemberNames()) {
            if (sources[name].isString()) state.hashes_[name] = sources[name].asString();
        }
    }
    const Json::Value& mapping = root["test_mapping"];
    if (mapping.isObject()) {
        for (const auto& name : mapping.getMemberNames()) {
            std::vector<std::string> tests;
            for (const auto& test : mapping[name]) {
                if (test.isString()) tests.push_back(test.asString());
            }
            state.tests_[name] = std::move(tests);
        }
    }
    spdlog::debug("Loaded change state for {} sources from {}", state.hashes_.size(), path.string());
    return state;
}

void ChangeState::save(const std::filesystem::path& path) const {
    Json::Value root;
    Json::Value sources(Json::objectValue);
    for (const auto& [name, hash] : hashes_) {
        sources[name] = hash;
    }
    root["source_files"] = sources;

    Json::Value mapping(Json::objectValue);
    for (const auto& [name, tests] : tests_) {
        Json::Value list(Json::arrayValue);
        for (const auto& test : tests) {
            list.append(test);
        }
        mapping[name] = list;
    }
    root["test_mapping"] = mapping;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    try {
        write_text_file(path, Json::writeString(writer, root) + "\n");
    } catch (const Error& e) {
        throw ReportError(std::string("cannot write change state: ") + e.what());
    }
}

ChangeSet ChangeState::diff(const std::map<std::string, std::string>& current) const {
    ChangeSet changes;
    for (const auto& [name, hash] : current) {
        auto it = hashes_.find(name);
        if (it == hashes_.end() || it->second != hash) {
            changes.changed.insert(name);
        }
    }
    for (const auto& entry : hashes_) {
        if (current.count(entry.first) == 0) {
            changes.deleted.insert(entry.first);
        }
    }
    return changes;
}

std::vector<std::string> ChangeState::tests_for(const std::string& source) const {
    auto it = tests_.find(source);
    return it == tests_.end() ? std::vector<std::string>{} : it->second;
}

void ChangeState::set_tests(const std::string& source, std::vector<std::string> tests) {
    tests_[source] = std::move(tests);
}

std::filesystem::path change_state_path(const Config& config) {
    return std::filesystem::path(config.project_root) / config.generated_dir / ".change_state.json";
}

std::string content_hash(const std::string& content) {
    boost::crc_32_type crc;
    crc.process_bytes(content.data(), content.size());
    std::ostringstream out;
    out << std::hex << std::setw(8) << std::setfill('0') << crc.checksum();
    return out.str();
}

std::map<std::string, std::string> hash_sources(const std::filesystem::path& root,
                                                const std::vector<std::string>& files) {
    std::map<std::string, std::string> hashes;
    for (const auto& file : files) {
        try {
            hashes[file] = content_hash(read_text_file(root / file));
        } catch (const Error& e) {
            spdlog::warn("Cannot hash {}: {}", file, e.what());
        }
    }
    return hashes;
}

}  // namespace testforge
