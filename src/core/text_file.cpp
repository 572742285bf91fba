#include "core/text_file.h"
#include "core/errors.h"
#include <fstream>
#include <sstream>

namespace testforge {

std::string read_text_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw Error("cannot open " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw Error("read failed for " + path.string());
    }
    return buffer.str();
}

void write_text_file(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw Error("cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw Error("cannot open " + path.string() + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        throw Error("write failed for " + path.string());
    }
}

std::vector<std::string> split_lines_keep_ends(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
    }
    return out;
}

std::string slice_lines(const std::string& text, const LineRange& range) {
    auto lines = split_lines_keep_ends(text);
    std::string out;
    for (int line = range.begin; line < range.end; ++line) {
        if (line < 1 || line > static_cast<int>(lines.size())) continue;
        out += lines[line - 1];
    }
    return out;
}

}  // namespace testforge
