#pragma once
#ifndef TESTFORGE_TYPES_H
#define TESTFORGE_TYPES_H

#include <string>
#include <optional>
#include <tuple>
#include "core/line_range.h"

namespace testforge {

enum class SymbolKind {
    Function,
    Method,
    Class,
    Route,
};

std::string to_string(SymbolKind kind);
std::optional<SymbolKind> symbol_kind_from_string(const std::string& text);

// Identity of a symbol across components: root-relative file plus qualified name
struct SymbolKey {
    std::string file;
    std::string name;

    bool operator==(const SymbolKey& other) const {
        return file == other.file && name == other.name;
    }
    bool operator<(const SymbolKey& other) const {
        return std::tie(file, name) < std::tie(other.file, other.name);
    }
    std::string to_string() const { return file + "::" + name; }
};

struct Symbol {
    std::string name;
    std::string qualified_name;     // Class.method, outer.inner
    std::string file;               // root-relative, '/' separated
    SymbolKind kind = SymbolKind::Function;
    LineRange range;                // def/class line through last body line
    LineRange outer_range;          // same, widened to include decorators
    int arg_count = 0;
    bool is_async = false;
    int depth = 0;                  // 0 for module level
    std::string parent;             // qualified name of the enclosing symbol

    SymbolKey key() const { return {file, qualified_name}; }
    int start_line() const { return range.first_line(); }
    int end_line() const { return range.last_line(); }
};

// HTTP handler discovered from a verb decorator
struct Route {
    std::string handler_name;
    std::string qualified_name;
    std::string file;
    std::string method;             // GET, POST, ...
    std::string path;
    LineRange range;
    LineRange outer_range;
    int arg_count = 0;
    bool is_async = false;

    Symbol as_symbol() const;
};

// A local name bound by an import statement
struct ImportBinding {
    std::string bound_name;
    std::string module_path;        // dotted, may start with '.' for relative imports
    int line = 0;
};

enum class DefinitionKind {
    Function,
    Class,
    Assignment,
};

// Location of one definition inside a parsed file
struct Definition {
    std::string name;
    std::string qualified_name;
    DefinitionKind kind = DefinitionKind::Function;
    LineRange range;
    LineRange outer_range;
};

}  // namespace testforge

#endif  // TESTFORGE_TYPES_H
