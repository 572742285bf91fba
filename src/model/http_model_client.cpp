#include "model/http_model_client.h"
#include "core/errors.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>
#include <sstream>
#include <thread>

namespace testforge {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr int kMaxBackoffShift = 6;
constexpr int kMaxBackoffSecs = 60;

}  // namespace

ModelEndpoint parse_endpoint(const std::string& url) {
    static const std::regex kUrl(R"(^(\w+)://([^/:]+)(?::(\d+))?(/.*)?$)");
    std::smatch m;
    if (!std::regex_match(url, m, kUrl)) {
        throw ModelError("malformed model URL: " + url);
    }
    if (m[1].str() != "http") {
        throw ModelError("only http:// model endpoints are supported: " + url);
    }

    ModelEndpoint endpoint;
    endpoint.host = m[2].str();
    endpoint.port = m[3].matched ? m[3].str() : "80";
    endpoint.target = m[4].matched ? m[4].str() : "/";
    endpoint.style = endpoint.target.find("/chat/completions") != std::string::npos
        ? ApiStyle::OpenAi
        : ApiStyle::Ollama;
    return endpoint;
}

std::chrono::seconds retry_delay(int attempt) {
    int shift = std::max(0, std::min(attempt, kMaxBackoffShift));
    return std::chrono::seconds(std::min(1 << shift, kMaxBackoffSecs));
}

HttpModelClient::HttpModelClient(const Config& config)
    : endpoint_(parse_endpoint(config.model_url)),
      model_(config.model_name),
      api_key_(config.model_api_key),
      temperature_(config.model_temperature),
      timeout_(config.model_timeout_secs),
      retries_(config.model_retries) {
}

std::string HttpModelClient::build_request_body(const std::string& system_prompt,
                                                const std::string& user_prompt) const {
    Json::Value body;
    body["model"] = model_;

    Json::Value messages(Json::arrayValue);
    Json::Value system;
    system["role"] = "system";
    system["content"] = system_prompt;
    messages.append(system);
    Json::Value user;
    user["role"] = "user";
    user["content"] = user_prompt;
    messages.append(user);
    body["messages"] = messages;

    if (endpoint_.style == ApiStyle::Ollama) {
        body["stream"] = false;
        if (temperature_) body["options"]["temperature"] = *temperature_;
    } else if (temperature_) {
        body["temperature"] = *temperature_;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, body);
}

std::string HttpModelClient::parse_response_body(const std::string& body) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream in(body);
    if (!Json::parseFromStream(builder, in, &root, &errors) || !root.isObject()) {
        throw ModelError("model response is not a JSON object: " + errors);
    }

    const Json::Value& choices = root["choices"];
    if (choices.isArray() && !choices.empty()) {
        const Json::Value& content = choices[0]["message"]["content"];
        if (content.isString()) return content.asString();
    }
    const Json::Value& message = root["message"]["content"];
    if (message.isString()) return message.asString();
    if (root["response"].isString()) return root["response"].asString();

    if (root.isMember("error")) {
        const Json::Value& error = root["error"];
        std::string detail = error.isObject()   ? error.get("message", "").asString()
                             : error.isString() ? error.asString()
                                                : error.toStyledString();
        throw ModelError("model endpoint reported an error: " + detail);
    }
    throw ModelError("model response has no message content");
}

std::string HttpModelClient::post(const std::string& body) {
    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    http::request<http::string_body> req{http::verb::post, endpoint_.target, 11};
    req.set(http::field::host, endpoint_.host);
    req.set(http::field::user_agent, "testforge");
    req.set(http::field::content_type, "application/json");
    if (!api_key_.empty()) {
        req.set(http::field::authorization, "Bearer " + api_key_);
    }
    req.body() = body;
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code result;

    stream.expires_after(timeout_);
    resolver.async_resolve(endpoint_.host, endpoint_.port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) { result = ec; return; }
            stream.async_connect(results, [&](beast::error_code ec, tcp::endpoint) {
                if (ec) { result = ec; return; }
                http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
                    if (ec) { result = ec; return; }
                    http::async_read(stream, buffer, res, [&](beast::error_code ec, std::size_t) {
                        result = ec;
                    });
                });
            });
        });
    ioc.run();

    if (result) {
        throw ModelError("request to " + endpoint_.host + ":" + endpoint_.port + endpoint_.target +
                         " failed: " + result.message());
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("Model connection shutdown: {}", ec.message());
    }

    if (res.result_int() >= 400) {
        throw ModelError("model endpoint returned HTTP " + std::to_string(res.result_int()) + ": " +
                         res.body().substr(0, 200));
    }
    return res.body();
}

std::string HttpModelClient::complete(const std::string& system_prompt, const std::string& user_prompt) {
    std::string request = build_request_body(system_prompt, user_prompt);
    std::string last_error;

    for (int attempt = 0; attempt < retries_; ++attempt) {
        try {
            return parse_response_body(post(request));
        } catch (const ModelError& e) {
            last_error = e.what();
            if (attempt + 1 < retries_) {
                auto delay = retry_delay(attempt);
                spdlog::warn("Model call failed ({}), retrying in {}s", last_error, delay.count());
                std::this_thread::sleep_for(delay);
            }
        }
    }
    throw ModelError("model call failed after " + std::to_string(retries_) + " attempts: " + last_error);
}

}  // namespace testforge
