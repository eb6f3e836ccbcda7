#pragma once
/**
 *  Collaborator seams of the query pipeline.
 *
 *  The server wires the HTTP/PostgreSQL implementations; tests inject
 *  in-process fakes. Implementations report failures as
 *  fchat::CollaboratorFailure and must be callable from several
 *  worker threads at once.
 */
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace fchat::llm
{

/** One nearest-neighbour hit: the stored metadata and its distance. */
struct RetrievalMatch
{
    std::map<std::string, std::string> metadata;   ///< MessageName, Description, Fields (JSON)
    double                             distance = 0.0;
};

class RetrievalService
{
public:
    virtual ~RetrievalService() = default;
    virtual std::vector<RetrievalMatch> search(const std::string& query, std::size_t k) = 0;
};

class EmbeddingService
{
public:
    virtual ~EmbeddingService() = default;
    virtual std::vector<float> embed(const std::string& text) = 0;
};

struct CompletionOptions
{
    std::string model;
    double      temperature = 0.0;
    int         max_tokens  = 1024;
};

class CompletionService
{
public:
    virtual ~CompletionService() = default;
    virtual std::string complete(const std::string& prompt, const CompletionOptions& opts) = 0;
};

} // namespace fchat::llm
