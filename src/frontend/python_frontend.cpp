#include "frontend/python_frontend.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

extern "C" const TSLanguage* tree_sitter_python(void);

namespace testforge {

namespace {

using ParserPtr = std::unique_ptr<TSParser, decltype(&ts_parser_delete)>;
using TreePtr = std::unique_ptr<TSTree, decltype(&ts_tree_delete)>;

const char* const kRouteVerbs[] = {"get", "post", "put", "delete", "patch", "head", "options"};
// Django URL confs do not restrict the HTTP method
const char* const kAnyMethod = "ANY";

bool is_type(TSNode node, const char* type) {
    return std::strcmp(ts_node_type(node), type) == 0;
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

std::string text_of(TSNode node, const std::string& source) {
    if (ts_node_is_null(node)) return {};
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (end > source.size() || start > end) return {};
    return source.substr(start, end - start);
}

int first_line(TSNode node) {
    return static_cast<int>(ts_node_start_point(node).row) + 1;
}

// A node that ends at column 0 of a row actually ends on the row before
int last_line(TSNode node) {
    TSPoint start = ts_node_start_point(node);
    TSPoint end = ts_node_end_point(node);
    if (end.column == 0 && end.row > start.row) {
        return static_cast<int>(end.row);
    }
    return static_cast<int>(end.row) + 1;
}

LineRange range_of(TSNode node) {
    return LineRange::from_inclusive(first_line(node), last_line(node));
}

bool find_error(TSNode node, TSNode& out) {
    if (is_type(node, "ERROR") || ts_node_is_missing(node)) {
        out = node;
        return true;
    }
    if (!ts_node_has_error(node)) return false;
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        if (find_error(ts_node_child(node, i), out)) return true;
    }
    out = node;
    return true;
}

// Strips string prefixes (r, b, f, u) and the surrounding quotes
std::optional<std::string> unquote(const std::string& literal) {
    size_t pos = 0;
    while (pos < literal.size() && std::isalpha(static_cast<unsigned char>(literal[pos]))) {
        ++pos;
    }
    std::string body = literal.substr(pos);
    if (body.size() >= 6 && (body.compare(0, 3, "\"\"\"") == 0 || body.compare(0, 3, "'''") == 0)) {
        return body.substr(3, body.size() - 6);
    }
    if (body.size() >= 2 && (body.front() == '"' || body.front() == '\'') && body.back() == body.front()) {
        return body.substr(1, body.size() - 2);
    }
    return std::nullopt;
}

std::optional<std::string> string_value(TSNode node, const std::string& source) {
    if (ts_node_is_null(node) || !is_type(node, "string")) return std::nullopt;
    return unquote(text_of(node, source));
}

TSNode positional_argument(TSNode call, uint32_t index) {
    TSNode args = field(call, "arguments");
    if (ts_node_is_null(args)) return args;
    uint32_t count = ts_node_named_child_count(args);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode arg = ts_node_named_child(args, i);
        if (is_type(arg, "keyword_argument") || is_type(arg, "comment")) continue;
        if (index == 0) return arg;
        --index;
    }
    return TSNode{};
}

TSNode first_positional_argument(TSNode call) {
    return positional_argument(call, 0);
}

std::string callee_name(TSNode call, const std::string& source) {
    TSNode fn = field(call, "function");
    if (ts_node_is_null(fn)) return {};
    if (is_type(fn, "attribute")) return text_of(field(fn, "attribute"), source);
    if (is_type(fn, "identifier")) return text_of(fn, source);
    return {};
}

bool is_dotted_identifier(const std::string& text) {
    if (text.empty() || text.front() == '.' || text.back() == '.') return false;
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
    });
}

std::vector<std::string> dotted_prefixes(const std::string& dotted) {
    std::vector<std::string> prefixes;
    size_t pos = dotted.find('.');
    while (pos != std::string::npos) {
        prefixes.push_back(dotted.substr(0, pos));
        pos = dotted.find('.', pos + 1);
    }
    return prefixes;
}

std::string strip_spaces(std::string text) {
    text.erase(std::remove_if(text.begin(), text.end(),
                              [](char c) { return std::isspace(static_cast<unsigned char>(c)); }),
               text.end());
    return text;
}

enum class ScopeKind { Module, Class, Function };

struct Scope {
    std::string qualified;
    ScopeKind kind = ScopeKind::Module;
    int depth = 0;
};

// One function or class definition together with its decorated wrapper
struct DefinitionSite {
    TSNode def;
    TSNode outer;
    std::string name;
    std::string qualified;
    std::string parent;
    int depth = 0;
    SymbolKind kind = SymbolKind::Function;
};

void collect_sites(TSNode node, const Scope& scope, const std::string& source,
                   std::vector<DefinitionSite>& out) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        TSNode def = child;
        if (is_type(child, "decorated_definition")) {
            def = field(child, "definition");
        }
        bool is_function = !ts_node_is_null(def) && is_type(def, "function_definition");
        bool is_class = !ts_node_is_null(def) && is_type(def, "class_definition");
        if (!is_function && !is_class) {
            collect_sites(child, scope, source, out);
            continue;
        }

        DefinitionSite site;
        site.def = def;
        site.outer = child;
        site.name = text_of(field(def, "name"), source);
        site.qualified = scope.qualified.empty() ? site.name : scope.qualified + "." + site.name;
        site.parent = scope.qualified;
        site.depth = scope.depth;
        if (is_class) {
            site.kind = SymbolKind::Class;
        } else if (scope.kind == ScopeKind::Class) {
            site.kind = SymbolKind::Method;
        } else {
            site.kind = SymbolKind::Function;
        }
        out.push_back(site);

        TSNode body = field(def, "body");
        if (!ts_node_is_null(body)) {
            Scope inner{site.qualified, is_class ? ScopeKind::Class : ScopeKind::Function,
                        scope.depth + 1};
            collect_sites(body, inner, source, out);
        }
    }
}

std::vector<DefinitionSite> definition_sites(const PythonParsedFile& file) {
    std::vector<DefinitionSite> sites;
    collect_sites(file.root(), Scope{}, file.source(), sites);
    return sites;
}

bool is_async_function(TSNode def) {
    uint32_t count = ts_node_child_count(def);
    for (uint32_t i = 0; i < count; ++i) {
        if (is_type(ts_node_child(def, i), "async")) return true;
    }
    return false;
}

bool is_splat(TSNode param) {
    if (is_type(param, "list_splat_pattern") || is_type(param, "dictionary_splat_pattern") ||
        is_type(param, "keyword_separator")) {
        return true;
    }
    if (is_type(param, "typed_parameter") && ts_node_named_child_count(param) > 0) {
        TSNode inner = ts_node_named_child(param, 0);
        return is_type(inner, "list_splat_pattern") || is_type(inner, "dictionary_splat_pattern");
    }
    return false;
}

// Positional parameters before the first *, *args or **kwargs
int positional_arg_count(TSNode def) {
    TSNode params = field(def, "parameters");
    if (ts_node_is_null(params)) return 0;
    int count = 0;
    uint32_t n = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < n; ++i) {
        TSNode param = ts_node_named_child(params, i);
        if (is_splat(param)) break;
        if (is_type(param, "identifier") || is_type(param, "typed_parameter") ||
            is_type(param, "default_parameter") || is_type(param, "typed_default_parameter")) {
            ++count;
        }
    }
    return count;
}

Definition to_definition(const DefinitionSite& site) {
    Definition d;
    d.name = site.name;
    d.qualified_name = site.qualified;
    d.kind = site.kind == SymbolKind::Class ? DefinitionKind::Class : DefinitionKind::Function;
    d.range = range_of(site.def);
    d.outer_range = range_of(site.outer);
    return d;
}

struct RouteMatch {
    std::string method;
    std::string path;
};

std::optional<RouteMatch> match_route(TSNode decorator, const std::string& source) {
    if (ts_node_named_child_count(decorator) == 0) return std::nullopt;
    TSNode expr = ts_node_named_child(decorator, 0);
    if (!is_type(expr, "call")) return std::nullopt;
    TSNode fn = field(expr, "function");
    if (ts_node_is_null(fn) || !is_type(fn, "attribute")) return std::nullopt;

    std::string attr = text_of(field(fn, "attribute"), source);
    RouteMatch match;
    match.path = string_value(first_positional_argument(expr), source).value_or("");

    for (const char* verb : kRouteVerbs) {
        if (attr == verb) {
            match.method = attr;
            std::transform(match.method.begin(), match.method.end(), match.method.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return match;
        }
    }
    if (attr != "route") return std::nullopt;

    match.method = "GET";
    TSNode args = field(expr, "arguments");
    uint32_t n = ts_node_named_child_count(args);
    for (uint32_t i = 0; i < n; ++i) {
        TSNode arg = ts_node_named_child(args, i);
        if (!is_type(arg, "keyword_argument")) continue;
        if (text_of(field(arg, "name"), source) != "methods") continue;
        TSNode value = field(arg, "value");
        if (!ts_node_is_null(value) && ts_node_named_child_count(value) > 0) {
            if (auto first = string_value(ts_node_named_child(value, 0), source)) {
                match.method = *first;
                std::transform(match.method.begin(), match.method.end(), match.method.begin(),
                               [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            }
        }
    }
    return match;
}

// path("users/", views.user_list) or re_path(r"^u/$", UserView.as_view()); include(...) is skipped
std::optional<Route> url_entry(TSNode entry, const std::string& source, const std::string& file) {
    if (!is_type(entry, "call")) return std::nullopt;
    std::string kind = callee_name(entry, source);
    if (kind != "path" && kind != "re_path") return std::nullopt;

    auto pattern = string_value(positional_argument(entry, 0), source);
    TSNode view = positional_argument(entry, 1);
    if (!pattern || ts_node_is_null(view)) return std::nullopt;
    if (is_type(view, "call")) {
        TSNode fn = field(view, "function");
        if (ts_node_is_null(fn) || !is_type(fn, "attribute") ||
            text_of(field(fn, "attribute"), source) != "as_view") {
            return std::nullopt;
        }
        view = field(fn, "object");
    }
    std::string handler = strip_spaces(text_of(view, source));
    if (!is_dotted_identifier(handler)) return std::nullopt;

    Route route;
    route.handler_name = handler.substr(handler.rfind('.') + 1);
    route.qualified_name = handler;
    route.file = file;
    route.method = kAnyMethod;
    route.path = *pattern;
    route.range = range_of(entry);
    route.outer_range = route.range;
    return route;
}

// Top-level `urlpatterns = [...]` and `urlpatterns += [...]` of a Django URL conf
void collect_urlpatterns(TSNode root, const std::string& source, const std::string& file,
                         std::vector<Route>& routes) {
    uint32_t count = ts_node_named_child_count(root);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode stmt = ts_node_named_child(root, i);
        if (!is_type(stmt, "expression_statement") || ts_node_named_child_count(stmt) == 0) continue;
        TSNode assign = ts_node_named_child(stmt, 0);
        if (!is_type(assign, "assignment") && !is_type(assign, "augmented_assignment")) continue;
        if (text_of(field(assign, "left"), source) != "urlpatterns") continue;

        TSNode list = field(assign, "right");
        if (ts_node_is_null(list) || !is_type(list, "list")) continue;
        uint32_t n = ts_node_named_child_count(list);
        for (uint32_t j = 0; j < n; ++j) {
            if (auto route = url_entry(ts_node_named_child(list, j), source, file)) {
                routes.push_back(std::move(*route));
            }
        }
    }
}

class ImportCollector {
public:
    explicit ImportCollector(const std::string& source) : source_(source) {}

    void visit(TSNode node) {
        if (is_type(node, "import_statement")) {
            import_statement(node);
        } else if (is_type(node, "import_from_statement")) {
            import_from_statement(node);
        } else if (is_type(node, "call")) {
            string_target(node);
        }
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            visit(ts_node_named_child(node, i));
        }
    }

    std::vector<ImportBinding> take() { return std::move(bindings_); }

private:
    void add(const std::string& bound, const std::string& module, TSNode at) {
        if (bound.empty() || module.empty()) return;
        if (!seen_.insert(bound + "\n" + module).second) return;
        bindings_.push_back({bound, module, first_line(at)});
    }

    void add_with_prefixes(const std::string& module, TSNode at) {
        for (const auto& prefix : dotted_prefixes(module)) {
            add(prefix, prefix, at);
        }
    }

    void import_statement(TSNode node) {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (is_type(child, "dotted_name")) {
                std::string module = strip_spaces(text_of(child, source_));
                add(module, module, node);
                add_with_prefixes(module, node);
            } else if (is_type(child, "aliased_import")) {
                std::string module = strip_spaces(text_of(field(child, "name"), source_));
                add(text_of(field(child, "alias"), source_), module, node);
                add_with_prefixes(module, node);
            }
        }
    }

    void import_from_statement(TSNode node) {
        TSNode module_node = field(node, "module_name");
        std::string module = strip_spaces(text_of(module_node, source_));
        if (module.empty()) return;
        bool only_dots = module.find_first_not_of('.') == std::string::npos;

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (ts_node_eq(child, module_node)) continue;
            std::string name;
            std::string bound;
            if (is_type(child, "dotted_name")) {
                name = strip_spaces(text_of(child, source_));
                bound = name;
            } else if (is_type(child, "aliased_import")) {
                name = strip_spaces(text_of(field(child, "name"), source_));
                bound = text_of(field(child, "alias"), source_);
            } else {
                continue;
            }
            add(bound, only_dots ? module + name : module + "." + name, node);
        }
        if (!only_dots) {
            add(module, module, node);
        }
    }

    // patch("a.b.c"), monkeypatch.setattr("a.b.c", ...), importorskip("a.b")
    void string_target(TSNode call) {
        std::string callee = callee_name(call, source_);
        if (callee != "patch" && callee != "setattr" && callee != "importorskip") return;
        auto target = string_value(first_positional_argument(call), source_);
        if (!target || !is_dotted_identifier(*target)) return;
        if (callee == "importorskip") {
            add(*target, *target, call);
            return;
        }
        size_t dot = target->rfind('.');
        if (dot == std::string::npos) return;
        std::string module = target->substr(0, dot);
        add(module, module, call);
    }

    const std::string& source_;
    std::set<std::string> seen_;
    std::vector<ImportBinding> bindings_;
};

void collect_references(TSNode node, const LineRange& range, const std::string& source,
                        std::set<std::string>& out) {
    if (!range_of(node).overlaps(range)) return;
    if (is_type(node, "identifier")) {
        out.insert(text_of(node, source));
    } else if (is_type(node, "attribute")) {
        std::string dotted = strip_spaces(text_of(node, source));
        if (is_dotted_identifier(dotted)) {
            out.insert(dotted);
            for (const auto& prefix : dotted_prefixes(dotted)) {
                out.insert(prefix);
            }
        }
    }
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        collect_references(ts_node_named_child(node, i), range, source, out);
    }
}

}  // namespace

PythonParsedFile::PythonParsedFile(std::string path, std::string source, TSTree* tree)
    : ParsedFile(std::move(path), std::move(source)), tree_(tree, ts_tree_delete) {}

PythonFrontend::PythonFrontend() : language_(tree_sitter_python()) {}

bool PythonFrontend::handles(const std::filesystem::path& file) const {
    return file.extension() == ".py";
}

bool PythonFrontend::is_test_file(const std::filesystem::path& file) const {
    if (!handles(file)) return false;
    std::string name = file.filename().string();
    if (name == "conftest.py") return true;
    if (name.rfind("test_", 0) == 0) return true;
    return name.size() > 8 && name.compare(name.size() - 8, 8, "_test.py") == 0;
}

TSTree* PythonFrontend::parse_tree(const std::string& source) const {
    ParserPtr parser(ts_parser_new(), ts_parser_delete);
    if (!ts_parser_set_language(parser.get(), language_)) {
        throw Error("tree-sitter-python grammar is incompatible with the tree-sitter runtime");
    }
    return ts_parser_parse_string(parser.get(), nullptr, source.data(),
                                  static_cast<uint32_t>(source.size()));
}

std::unique_ptr<ParsedFile> PythonFrontend::parse_file(const std::string& path,
                                                       const std::string& source) const {
    TSTree* tree = parse_tree(source);
    if (!tree) {
        throw ParseError(path, 0, "parser produced no tree");
    }
    auto parsed = std::make_unique<PythonParsedFile>(path, source, tree);

    TSNode error{};
    if (find_error(parsed->root(), error)) {
        std::string detail = ts_node_is_missing(error)
            ? std::string("missing ") + ts_node_type(error)
            : "invalid syntax";
        throw ParseError(path, first_line(error), detail);
    }
    return parsed;
}

bool PythonFrontend::is_valid(const std::string& source) const {
    TreePtr tree(parse_tree(source), ts_tree_delete);
    if (!tree) return false;
    return !ts_node_has_error(ts_tree_root_node(tree.get()));
}

const PythonParsedFile& PythonFrontend::as_python(const ParsedFile& file) const {
    auto* parsed = dynamic_cast<const PythonParsedFile*>(&file);
    if (!parsed) {
        throw std::invalid_argument("not a Python parse result: " + file.path());
    }
    return *parsed;
}

std::vector<Symbol> PythonFrontend::extract_symbols(const ParsedFile& file) const {
    const auto& parsed = as_python(file);
    std::vector<Symbol> symbols;
    for (const auto& site : definition_sites(parsed)) {
        Symbol sym;
        sym.name = site.name;
        sym.qualified_name = site.qualified;
        sym.file = file.path();
        sym.kind = site.kind;
        sym.range = range_of(site.def);
        sym.outer_range = range_of(site.outer);
        sym.depth = site.depth;
        sym.parent = site.parent;
        if (site.kind != SymbolKind::Class) {
            sym.arg_count = positional_arg_count(site.def);
            sym.is_async = is_async_function(site.def);
        }
        symbols.push_back(std::move(sym));
    }
    return symbols;
}

std::vector<Route> PythonFrontend::extract_routes(const ParsedFile& file) const {
    const auto& parsed = as_python(file);
    std::vector<Route> routes;
    for (const auto& site : definition_sites(parsed)) {
        if (site.kind == SymbolKind::Class || !is_type(site.outer, "decorated_definition")) {
            continue;
        }
        uint32_t count = ts_node_named_child_count(site.outer);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode decorator = ts_node_named_child(site.outer, i);
            if (!is_type(decorator, "decorator")) continue;
            auto match = match_route(decorator, file.source());
            if (!match) continue;

            Route route;
            route.handler_name = site.name;
            route.qualified_name = site.qualified;
            route.file = file.path();
            route.method = match->method;
            route.path = match->path;
            route.range = range_of(site.def);
            route.outer_range = range_of(site.outer);
            route.arg_count = positional_arg_count(site.def);
            route.is_async = is_async_function(site.def);
            routes.push_back(std::move(route));
            break;
        }
    }
    collect_urlpatterns(parsed.root(), file.source(), file.path(), routes);
    return routes;
}

std::vector<ImportBinding> PythonFrontend::extract_imports(const ParsedFile& file) const {
    const auto& parsed = as_python(file);
    ImportCollector collector(file.source());
    collector.visit(parsed.root());
    return collector.take();
}

std::optional<Definition> PythonFrontend::find_definition(const ParsedFile& file,
                                                          const std::string& qualified_name) const {
    const auto sites = definition_sites(as_python(file));
    for (const auto& site : sites) {
        if (site.qualified == qualified_name) return to_definition(site);
    }

    // Fall back to the bare name when it is unambiguous in the file
    std::string bare = qualified_name.substr(qualified_name.rfind('.') + 1);
    const DefinitionSite* found = nullptr;
    for (const auto& site : sites) {
        if (site.name != bare) continue;
        if (found) {
            spdlog::warn("{}: '{}' is defined more than once, refusing to guess", file.path(), bare);
            return std::nullopt;
        }
        found = &site;
    }
    if (!found) return std::nullopt;
    return to_definition(*found);
}

std::vector<Definition> PythonFrontend::top_level_definitions(const ParsedFile& file) const {
    const auto& parsed = as_python(file);
    TSNode root = parsed.root();
    std::vector<Definition> defs;

    uint32_t count = ts_node_named_child_count(root);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(root, i);
        TSNode def = is_type(child, "decorated_definition") ? field(child, "definition") : child;
        if (!ts_node_is_null(def) &&
            (is_type(def, "function_definition") || is_type(def, "class_definition"))) {
            Definition d;
            d.name = text_of(field(def, "name"), file.source());
            d.qualified_name = d.name;
            d.kind = is_type(def, "class_definition") ? DefinitionKind::Class
                                                      : DefinitionKind::Function;
            d.range = range_of(def);
            d.outer_range = range_of(child);
            defs.push_back(std::move(d));
            continue;
        }
        if (is_type(child, "expression_statement") && ts_node_named_child_count(child) > 0) {
            TSNode assign = ts_node_named_child(child, 0);
            if (!is_type(assign, "assignment")) continue;
            TSNode left = field(assign, "left");
            if (ts_node_is_null(left) || !is_type(left, "identifier")) continue;
            Definition d;
            d.name = text_of(left, file.source());
            d.qualified_name = d.name;
            d.kind = DefinitionKind::Assignment;
            d.range = range_of(child);
            d.outer_range = d.range;
            defs.push_back(std::move(d));
        }
    }
    return defs;
}

std::set<std::string> PythonFrontend::referenced_names(const ParsedFile& file,
                                                       const Definition& def) const {
    std::set<std::string> names;
    collect_references(as_python(file).root(), def.outer_range, file.source(), names);
    return names;
}

}  // namespace testforge
