#pragma once
#include <string>

#include "llm/http_client.hpp"
#include "llm/services.hpp"

namespace fchat::llm
{

/** Anthropic Messages API: one user message in, concatenated text blocks out. */
class AnthropicClient : public CompletionService
{
public:
    AnthropicClient(std::string url, std::string api_key, long timeout_ms);

    std::string complete(const std::string& prompt, const CompletionOptions& opts) override;

    /** Extracts the answer text from a Messages API response body. */
    static std::string parse_response(long status, const std::string& body);

private:
    std::string url_;
    std::string api_key_;
    HttpClient  http_;
};

} // namespace fchat::llm
