#include "coverage/coverage_map.h"
#include "core/errors.h"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <vector>

namespace testforge {

namespace pt = boost::property_tree;

namespace {

bool ends_with_path(const std::string& text, const std::string& suffix) {
    if (suffix.size() >= text.size()) return false;
    return text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0 &&
           text[text.size() - suffix.size() - 1] == '/';
}

double rate_of(const FileCoverage& cov) {
    size_t total = cov.covered.size() + cov.uncovered.size();
    return total == 0 ? 1.0 : static_cast<double>(cov.covered.size()) / static_cast<double>(total);
}

void read_class(const pt::ptree& cls, std::map<std::string, FileCoverage>& files) {
    std::string filename = cls.get<std::string>("<xmlattr>.filename", "");
    if (filename.empty()) {
        throw CoverageError("class element without a filename attribute");
    }
    FileCoverage& cov = files[filename];

    auto lines = cls.get_child_optional("lines");
    if (!lines) return;
    for (const auto& entry : *lines) {
        if (entry.first != "line") continue;
        int number = entry.second.get<int>("<xmlattr>.number");
        long hits = entry.second.get<long>("<xmlattr>.hits", 0);
        if (hits > 0) {
            cov.covered.insert(number);
            cov.uncovered.erase(number);
        } else if (cov.covered.count(number) == 0) {
            cov.uncovered.insert(number);
        }
    }
}

}  // namespace

void CoverageMap::set_file(const std::string& file, FileCoverage coverage) {
    files_[file] = std::move(coverage);
}

const FileCoverage* CoverageMap::find(const std::string& file) const {
    auto it = files_.find(file);
    if (it != files_.end()) {
        return &it->second;
    }
    const FileCoverage* match = nullptr;
    std::vector<std::string> candidates;
    for (const auto& [name, cov] : files_) {
        if (ends_with_path(name, file) || ends_with_path(file, name)) {
            match = &cov;
            candidates.push_back(name);
        }
    }
    if (candidates.size() > 1) {
        spdlog::warn("Coverage for {} is ambiguous ({} candidates, first {}), ignoring it", file,
                     candidates.size(), candidates.front());
        return nullptr;
    }
    return match;
}

CoverageMap parse_cobertura(std::istream& in) {
    pt::ptree tree;
    try {
        pt::read_xml(in, tree);
    } catch (const pt::xml_parser_error& e) {
        throw CoverageError(std::string("malformed coverage report: ") + e.what());
    }

    auto root = tree.get_child_optional("coverage");
    if (!root) {
        throw CoverageError("coverage report has no <coverage> root element");
    }

    std::map<std::string, FileCoverage> files;
    try {
        auto packages = root->get_child_optional("packages");
        if (packages) {
            for (const auto& pkg : *packages) {
                if (pkg.first != "package") continue;
                auto classes = pkg.second.get_child_optional("classes");
                if (!classes) continue;
                for (const auto& cls : *classes) {
                    if (cls.first == "class") {
                        read_class(cls.second, files);
                    }
                }
            }
        }
    } catch (const pt::ptree_error& e) {
        throw CoverageError(std::string("bad line entry in coverage report: ") + e.what());
    }

    CoverageMap map;
    size_t covered = 0;
    size_t total = 0;
    for (auto& [name, cov] : files) {
        cov.line_rate = rate_of(cov);
        covered += cov.covered.size();
        total += cov.covered.size() + cov.uncovered.size();
        map.set_file(name, std::move(cov));
    }

    auto overall = root->get_optional<double>("<xmlattr>.line-rate");
    if (overall) {
        map.set_line_rate(*overall);
    } else {
        map.set_line_rate(total == 0 ? 1.0 : static_cast<double>(covered) / static_cast<double>(total));
    }
    return map;
}

CoverageMap load_cobertura(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw CoverageError("cannot open coverage report " + path.string());
    }
    CoverageMap map = parse_cobertura(in);
    spdlog::info("Loaded coverage for {} files from {} ({:.1f}% overall)",
                 map.files().size(), path.string(), map.percent());
    return map;
}

}  // namespace testforge
