#pragma once
#ifndef TESTFORGE_PYTHON_FRONTEND_H
#define TESTFORGE_PYTHON_FRONTEND_H

#include <memory>
#include <string>
#include <vector>
#include "frontend/language_frontend.h"

extern "C" {
#include <tree_sitter/api.h>
}

namespace testforge {

class PythonParsedFile : public ParsedFile {
public:
    PythonParsedFile(std::string path, std::string source, TSTree* tree);

    TSNode root() const { return ts_tree_root_node(tree_.get()); }

private:
    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree_;
};

// Python front end on tree-sitter-python
class PythonFrontend : public LanguageFrontend {
public:
    PythonFrontend();

    std::string name() const override { return "python"; }
    bool handles(const std::filesystem::path& file) const override;
    bool is_test_file(const std::filesystem::path& file) const override;
    std::string module_extension() const override { return ".py"; }
    std::string package_index_file() const override { return "__init__.py"; }

    std::unique_ptr<ParsedFile> parse_file(const std::string& path,
                                           const std::string& source) const override;
    bool is_valid(const std::string& source) const override;

    std::vector<Symbol> extract_symbols(const ParsedFile& file) const override;
    std::vector<Route> extract_routes(const ParsedFile& file) const override;
    std::vector<ImportBinding> extract_imports(const ParsedFile& file) const override;

    std::optional<Definition> find_definition(const ParsedFile& file,
                                              const std::string& qualified_name) const override;
    std::vector<Definition> top_level_definitions(const ParsedFile& file) const override;
    std::set<std::string> referenced_names(const ParsedFile& file,
                                           const Definition& def) const override;

private:
    const PythonParsedFile& as_python(const ParsedFile& file) const;
    TSTree* parse_tree(const std::string& source) const;

    const TSLanguage* language_;
};

}  // namespace testforge

#endif  // TESTFORGE_PYTHON_FRONTEND_H
