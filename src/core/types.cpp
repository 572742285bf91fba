#include "core/types.h"

namespace testforge {

std::string to_string(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Function: return "function";
        case SymbolKind::Method: return "method";
        case SymbolKind::Class: return "class";
        case SymbolKind::Route: return "route";
    }
    return "function";
}

std::optional<SymbolKind> symbol_kind_from_string(const std::string& text) {
    if (text == "function") return SymbolKind::Function;
    if (text == "method") return SymbolKind::Method;
    if (text == "class") return SymbolKind::Class;
    if (text == "route") return SymbolKind::Route;
    return std::nullopt;
}

Symbol Route::as_symbol() const {
    Symbol sym;
    sym.name = handler_name;
    sym.qualified_name = qualified_name;
    sym.file = file;
    sym.kind = SymbolKind::Route;
    sym.range = range;
    sym.outer_range = outer_range;
    sym.arg_count = arg_count;
    sym.is_async = is_async;
    return sym;
}

}  // namespace testforge
