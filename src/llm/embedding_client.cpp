#include "llm/embedding_client.hpp"
#include "core/errors.hpp"
#include "core/json_util.hpp"

namespace fchat::llm {

EmbeddingClient::EmbeddingClient(std::string url, std::string model,
                                 std::string api_key, long timeout_ms)
    : url_(std::move(url)), model_(std::move(model)),
      api_key_(std::move(api_key)), http_(timeout_ms)
{}

std::vector<float> EmbeddingClient::embed(const std::string& text)
{
    Json::Value req(Json::objectValue);
    req["model"] = model_;
    req["input"] = text;

    HttpClient::Headers headers;
    if (!api_key_.empty())
        headers.emplace_back("Authorization", "Bearer " + api_key_);

    const HttpResponse res = http_.post_json(url_, headers, core::to_compact(req));

    Json::Value doc;
    std::string err;
    if (!core::parse_json(res.body, doc, &err))
        throw CollaboratorFailure("embedding service returned invalid JSON (HTTP "
                                  + std::to_string(res.status) + ")");
    if (res.status < 200 || res.status >= 300) {
        const Json::Value& e = doc["error"];
        const std::string msg = e.isObject() ? e.get("message", "").asString()
                              : e.isString() ? e.asString() : "";
        throw CollaboratorFailure("embedding service HTTP " + std::to_string(res.status)
                                  + (msg.empty() ? "" : ": " + msg));
    }

    const Json::Value& data = doc["data"];
    if (!data.isArray() || data.empty() || !data[0]["embedding"].isArray())
        throw CollaboratorFailure("embedding response has no data[0].embedding");

    std::vector<float> vec;
    vec.reserve(data[0]["embedding"].size());
    for (const auto& x : data[0]["embedding"]) {
        if (!x.isNumeric())
            throw CollaboratorFailure("embedding contains a non-numeric value");
        vec.push_back(x.asFloat());
    }
    if (vec.empty())
        throw CollaboratorFailure("embedding service returned an empty vector");
    return vec;
}

} // namespace fchat::llm
