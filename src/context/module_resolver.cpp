#include "context/module_resolver.h"
#include <spdlog/spdlog.h>
#include <sstream>

namespace testforge {

namespace {

const char* const kExternalModules[] = {
    // standard library
    "__future__", "abc", "argparse", "array", "ast", "asyncio", "base64", "bisect", "builtins",
    "calendar", "collections", "concurrent", "contextlib", "copy", "csv", "ctypes", "dataclasses",
    "datetime", "decimal", "difflib", "email", "enum", "errno", "fnmatch", "fractions",
    "functools", "gc", "getpass", "glob", "gzip", "hashlib", "heapq", "hmac", "html", "http",
    "importlib", "inspect", "io", "ipaddress", "itertools", "json", "logging", "math",
    "mimetypes", "multiprocessing", "numbers", "operator", "os", "pathlib", "pickle", "platform",
    "pprint", "queue", "random", "re", "secrets", "select", "shlex", "shutil", "signal",
    "socket", "sqlite3", "ssl", "statistics", "string", "struct", "subprocess", "sys",
    "tempfile", "textwrap", "threading", "time", "timeit", "traceback", "types", "typing",
    "unittest", "urllib", "uuid", "warnings", "weakref", "xml", "zipfile", "zlib",
    // common third-party packages
    "aiohttp", "alembic", "attr", "attrs", "boto3", "celery", "click", "django", "fastapi",
    "flask", "freezegun", "httpx", "hypothesis", "jinja2", "jwt", "marshmallow", "mock",
    "numpy", "pandas", "pydantic", "pytest", "pytest_asyncio", "redis", "requests",
    "respx", "sqlalchemy", "starlette", "typing_extensions", "uvicorn", "werkzeug", "yaml",
};

std::vector<std::string> split_dotted(const std::string& module) {
    std::vector<std::string> parts;
    std::stringstream ss(module);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, size_t from, size_t to, char sep) {
    std::string out;
    for (size_t i = from; i < to; ++i) {
        if (!out.empty()) out += sep;
        out += parts[i];
    }
    return out;
}

}  // namespace

ModuleResolver::ModuleResolver(std::filesystem::path root, const LanguageFrontend& frontend,
                               const std::vector<std::string>& extra_external)
    : root_(std::move(root)),
      extension_(frontend.module_extension()),
      index_file_(frontend.package_index_file()),
      external_(std::begin(kExternalModules), std::end(kExternalModules)) {
    external_.insert(extra_external.begin(), extra_external.end());
}

bool ModuleResolver::is_external(const std::string& module) const {
    if (module.empty() || module.front() == '.') return false;
    return external_.count(module.substr(0, module.find('.'))) > 0;
}

std::string ModuleResolver::absolute_module(const std::string& module,
                                            const std::string& importing_file) const {
    if (module.empty() || module.front() != '.') return module;

    size_t dots = module.find_first_not_of('.');
    std::string rest = dots == std::string::npos ? "" : module.substr(dots);
    size_t levels = dots == std::string::npos ? module.size() : dots;

    std::vector<std::string> package;
    for (const auto& part : std::filesystem::path(importing_file).parent_path()) {
        std::string name = part.string();
        if (!name.empty() && name != ".") package.push_back(name);
    }
    for (size_t i = 1; i < levels && !package.empty(); ++i) {
        package.pop_back();
    }
    std::string base = join(package, 0, package.size(), '.');
    if (base.empty()) return rest;
    return rest.empty() ? base : base + "." + rest;
}

std::vector<std::string> ModuleResolver::candidate_paths(const std::string& module) const {
    auto parts = split_dotted(module);
    std::vector<std::string> paths;
    if (parts.empty()) return paths;

    std::string as_path = join(parts, 0, parts.size(), '/');
    paths.push_back(as_path + extension_);
    paths.push_back(as_path + "/" + index_file_);
    paths.push_back("src/" + as_path + extension_);
    paths.push_back("src/" + as_path + "/" + index_file_);
    if (parts.size() > 1) {
        paths.push_back(join(parts, 1, parts.size(), '/') + extension_);
    }
    return paths;
}

std::optional<ResolvedModule> ModuleResolver::resolve(const std::string& module,
                                                      const std::string& importing_file) const {
    std::string absolute = absolute_module(module, importing_file);
    if (absolute.empty()) return std::nullopt;

    auto find_file = [this](const std::string& name) -> std::optional<std::string> {
        for (const auto& candidate : candidate_paths(name)) {
            std::error_code ec;
            if (std::filesystem::is_regular_file(root_ / candidate, ec)) {
                return candidate;
            }
        }
        return std::nullopt;
    };

    if (auto file = find_file(absolute)) {
        return ResolvedModule{*file, ""};
    }
    size_t dot = absolute.rfind('.');
    if (dot != std::string::npos) {
        if (auto file = find_file(absolute.substr(0, dot))) {
            return ResolvedModule{*file, absolute.substr(dot + 1)};
        }
    }
    spdlog::debug("Could not resolve module '{}' under {}", absolute, root_.string());
    return std::nullopt;
}

}  // namespace testforge
