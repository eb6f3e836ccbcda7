#include "llm/anthropic_client.hpp"
#include "core/errors.hpp"
#include "core/json_util.hpp"

#include <iostream>

namespace fchat::llm {

namespace {
constexpr const char* kApiVersion = "2023-06-01";
}

AnthropicClient::AnthropicClient(std::string url, std::string api_key, long timeout_ms)
    : url_(std::move(url)), api_key_(std::move(api_key)), http_(timeout_ms)
{}

std::string AnthropicClient::complete(const std::string& prompt, const CompletionOptions& opts)
{
    Json::Value msg(Json::objectValue);
    msg["role"]    = "user";
    msg["content"] = prompt;

    Json::Value req(Json::objectValue);
    req["model"]       = opts.model;
    req["max_tokens"]  = opts.max_tokens;
    req["temperature"] = opts.temperature;
    req["messages"].append(msg);

    const HttpClient::Headers headers{
        {"x-api-key", api_key_},
        {"anthropic-version", kApiVersion},
    };

    std::cout << "[LLM] " << opts.model << " (T=" << opts.temperature
              << ", max " << opts.max_tokens << ") prompt " << prompt.size() << " bytes\n";

    const HttpResponse res = http_.post_json(url_, headers, core::to_compact(req));
    return parse_response(res.status, res.body);
}

std::string AnthropicClient::parse_response(long status, const std::string& body)
{
    Json::Value doc;
    if (!core::parse_json(body, doc))
        throw CollaboratorFailure("completion service returned invalid JSON (HTTP "
                                  + std::to_string(status) + ")");

    if (status < 200 || status >= 300 || doc.get("type", "").asString() == "error") {
        const std::string msg = doc["error"].isObject()
                              ? doc["error"].get("message", "").asString() : "";
        throw CollaboratorFailure("completion service HTTP " + std::to_string(status)
                                  + (msg.empty() ? "" : ": " + msg));
    }

    const Json::Value& content = doc["content"];
    if (!content.isArray())
        throw CollaboratorFailure("completion response has no content array");

    std::string text;
    for (const auto& block : content) {
        if (block.get("type", "").asString() == "text")
            text += block.get("text", "").asString();
    }
    return text;
}

} // namespace fchat::llm
