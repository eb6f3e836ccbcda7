#pragma once
#include "db/vector_index.hpp"
#include "llm/services.hpp"

namespace fchat::llm
{

/** Retrieval = embed the query text, then nearest neighbours in the index. */
class VectorRetriever : public RetrievalService
{
public:
    VectorRetriever(EmbeddingService& embedder, db::VectorIndex& index)
        : embedder_(embedder), index_(index) {}

    std::vector<RetrievalMatch> search(const std::string& query, std::size_t k) override
    {
        return index_.nearest(embedder_.embed(query), k);
    }

private:
    EmbeddingService& embedder_;
    db::VectorIndex&  index_;
};

} // namespace fchat::llm
