#pragma once
#ifndef TESTFORGE_LANGUAGE_FRONTEND_H
#define TESTFORGE_LANGUAGE_FRONTEND_H

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/types.h"

namespace testforge {

// Source text plus the structural tree a front end built for it.
// Each front end only accepts the ParsedFile objects it created.
class ParsedFile {
public:
    virtual ~ParsedFile() = default;

    const std::string& path() const { return path_; }
    const std::string& source() const { return source_; }

protected:
    ParsedFile(std::string path, std::string source)
        : path_(std::move(path)), source_(std::move(source)) {}

private:
    std::string path_;
    std::string source_;
};

// One implementation per supported source language
class LanguageFrontend {
public:
    virtual ~LanguageFrontend() = default;

    virtual std::string name() const = 0;
    virtual bool handles(const std::filesystem::path& file) const = 0;
    virtual bool is_test_file(const std::filesystem::path& file) const = 0;

    // Extension of a module file (".py") and the file that makes a directory a package
    virtual std::string module_extension() const = 0;
    virtual std::string package_index_file() const = 0;

    // Throws ParseError when the text does not form an error-free tree
    virtual std::unique_ptr<ParsedFile> parse_file(const std::string& path,
                                                   const std::string& source) const = 0;

    virtual bool is_valid(const std::string& source) const = 0;

    // Every definition at any depth, in definition order
    virtual std::vector<Symbol> extract_symbols(const ParsedFile& file) const = 0;
    virtual std::vector<Route> extract_routes(const ParsedFile& file) const = 0;
    virtual std::vector<ImportBinding> extract_imports(const ParsedFile& file) const = 0;

    virtual std::optional<Definition> find_definition(const ParsedFile& file,
                                                      const std::string& qualified_name) const = 0;
    virtual std::vector<Definition> top_level_definitions(const ParsedFile& file) const = 0;

    // Identifiers and dotted attribute chains used inside a definition
    virtual std::set<std::string> referenced_names(const ParsedFile& file,
                                                   const Definition& def) const = 0;
};

}  // namespace testforge

#endif  // TESTFORGE_LANGUAGE_FRONTEND_H
