#include "model/response_parser.h"
#include <sstream>

namespace testforge {

namespace {

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::optional<Json::Value> parse_object(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value value;
    std::string errors;
    std::istringstream in(text);
    if (!Json::parseFromStream(builder, in, &value, &errors) || !value.isObject()) {
        return std::nullopt;
    }
    return value;
}

// Index one past the brace that closes the one at `open`, skipping string literals
size_t matching_brace(const std::string& text, size_t open) {
    int depth = 0;
    bool in_string = false;
    for (size_t i = open; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) return i + 1;
        }
    }
    return std::string::npos;
}

}  // namespace

std::string strip_reasoning(const std::string& text) {
    static const std::string kOpen = "<think>";
    static const std::string kClose = "</think>";

    std::string out = text;
    size_t open = out.find(kOpen);
    while (open != std::string::npos) {
        size_t close = out.find(kClose, open);
        if (close == std::string::npos) break;
        out.erase(open, close + kClose.size() - open);
        open = out.find(kOpen, open);
    }
    // Some models drop the opening tag
    if (out.find(kOpen) == std::string::npos) {
        size_t close = out.find(kClose);
        if (close != std::string::npos) {
            out.erase(0, close + kClose.size());
        }
    }
    return out;
}

std::vector<FencedBlock> fenced_blocks(const std::string& text) {
    std::vector<FencedBlock> blocks;
    size_t pos = text.find("```");
    while (pos != std::string::npos) {
        size_t line_end = text.find('\n', pos);
        if (line_end == std::string::npos) break;
        FencedBlock block;
        block.language = trim(text.substr(pos + 3, line_end - pos - 3));
        size_t close = text.find("```", line_end + 1);
        if (close == std::string::npos) {
            block.body = text.substr(line_end + 1);
            blocks.push_back(std::move(block));
            break;
        }
        block.body = text.substr(line_end + 1, close - line_end - 1);
        blocks.push_back(std::move(block));
        pos = text.find("```", close + 3);
    }
    return blocks;
}

std::optional<Json::Value> extract_json_object(const std::string& text) {
    std::string cleaned = strip_reasoning(text);
    auto blocks = fenced_blocks(cleaned);

    for (const auto& block : blocks) {
        if (block.language == "json") {
            if (auto value = parse_object(block.body)) return value;
        }
    }
    for (const auto& block : blocks) {
        std::string body = trim(block.body);
        if (!body.empty() && body.front() == '{') {
            if (auto value = parse_object(body)) return value;
        }
    }

    size_t open = cleaned.find('{');
    while (open != std::string::npos) {
        size_t end = matching_brace(cleaned, open);
        if (end != std::string::npos) {
            if (auto value = parse_object(cleaned.substr(open, end - open))) return value;
        }
        open = cleaned.find('{', open + 1);
    }
    return std::nullopt;
}

std::string extract_code_block(const std::string& text, const std::string& language) {
    std::string cleaned = strip_reasoning(text);
    auto blocks = fenced_blocks(cleaned);

    for (const auto& block : blocks) {
        if (block.language == language || (language == "python" && block.language == "py")) {
            return block.body;
        }
    }
    if (!blocks.empty()) {
        return blocks.front().body;
    }
    std::string body = trim(cleaned);
    return body.empty() ? body : body + "\n";
}

}  // namespace testforge
