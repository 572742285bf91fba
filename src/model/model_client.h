#pragma once
#ifndef TESTFORGE_MODEL_CLIENT_H
#define TESTFORGE_MODEL_CLIENT_H

#include <string>

namespace testforge {

// Generative model seen as an opaque function: prompts in, text out
class ModelClient {
public:
    virtual ~ModelClient() = default;

    // Throws ModelError on transport failures and unusable responses
    virtual std::string complete(const std::string& system_prompt, const std::string& user_prompt) = 0;
};

}  // namespace testforge

#endif  // TESTFORGE_MODEL_CLIENT_H
