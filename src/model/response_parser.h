#pragma once
#ifndef TESTFORGE_RESPONSE_PARSER_H
#define TESTFORGE_RESPONSE_PARSER_H

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace testforge {

struct FencedBlock {
    std::string language;
    std::string body;
};

// Removes <think>...</think> preambles emitted by reasoning models
std::string strip_reasoning(const std::string& text);

std::vector<FencedBlock> fenced_blocks(const std::string& text);

// First JSON object in the text: ```json fence, any fence starting with '{', then a brace scan
std::optional<Json::Value> extract_json_object(const std::string& text);

// Body of the first ```<language> fence, else of any fence, else the trimmed text
std::string extract_code_block(const std::string& text, const std::string& language = "python");

}  // namespace testforge

#endif  // TESTFORGE_RESPONSE_PARSER_H
