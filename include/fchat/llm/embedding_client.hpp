#pragma once
#include <string>

#include "llm/http_client.hpp"
#include "llm/services.hpp"

namespace fchat::llm
{

/** OpenAI-compatible `/v1/embeddings` endpoint (OpenAI, Ollama, vLLM, ...). */
class EmbeddingClient : public EmbeddingService
{
public:
    EmbeddingClient(std::string url, std::string model, std::string api_key,
                    long timeout_ms);

    std::vector<float> embed(const std::string& text) override;

private:
    std::string url_;
    std::string model_;
    std::string api_key_;
    HttpClient  http_;
};

} // namespace fchat::llm
