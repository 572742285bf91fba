#pragma once
#ifndef TESTFORGE_HTTP_MODEL_CLIENT_H
#define TESTFORGE_HTTP_MODEL_CLIENT_H

#include <chrono>
#include <optional>
#include <string>
#include "config/config.h"
#include "model/model_client.h"

namespace testforge {

enum class ApiStyle {
    OpenAi,     // /v1/chat/completions
    Ollama,     // /api/chat
};

struct ModelEndpoint {
    std::string host;
    std::string port;
    std::string target;
    ApiStyle style = ApiStyle::Ollama;
};

// Plain http:// URLs only; throws ModelError otherwise
ModelEndpoint parse_endpoint(const std::string& url);

// 1s, 2s, 4s ... capped at one minute
std::chrono::seconds retry_delay(int attempt);

// Chat-completion client over boost::beast, one blocking request at a time
class HttpModelClient : public ModelClient {
public:
    explicit HttpModelClient(const Config& config);

    std::string complete(const std::string& system_prompt, const std::string& user_prompt) override;

    std::string build_request_body(const std::string& system_prompt,
                                   const std::string& user_prompt) const;

    // Message content from either response shape; throws ModelError
    static std::string parse_response_body(const std::string& body);

    const ModelEndpoint& endpoint() const { return endpoint_; }

private:
    std::string post(const std::string& body);

    ModelEndpoint endpoint_;
    std::string model_;
    std::string api_key_;
    std::optional<double> temperature_;
    std::chrono::seconds timeout_;
    int retries_;
};

}  // namespace testforge

#endif  // TESTFORGE_HTTP_MODEL_CLIENT_H
