#pragma once
/**
 *  Five-stage query pipeline, run once per chat turn:
 *
 *      retrieve → analyze → fetch_data → analyze_data → update_history
 *
 *  Stages run in this fixed order on the calling thread. A collaborator
 *  failure in retrieve / analyze / analyze_data ends the turn with
 *  fchat::CollaboratorFailure and update_history is not reached.
 *  fetch_data with nothing selected sets the canned no-data answer and
 *  the turn goes straight to update_history.
 */
#include <cstddef>
#include <memory>
#include <string>

#include "core/history.hpp"
#include "core/record_set.hpp"
#include "core/schema.hpp"
#include "llm/services.hpp"
#include "pipeline/pipeline_state.hpp"

namespace fchat::pipeline
{

struct PipelineOptions
{
    std::size_t            top_k   = 5;
    std::size_t            samples = 3;
    llm::CompletionOptions analyze{"claude-3-sonnet-20240229", 0.0, 2048};
    llm::CompletionOptions answer {"claude-3-opus-20240229",   0.3, 2000};
};

class QueryPipeline
{
public:
    QueryPipeline(const core::SchemaCatalog& catalog,
                  llm::RetrievalService& retrieval,
                  llm::CompletionService& completion,
                  std::shared_ptr<const core::DecodedRecordSet> records,
                  PipelineOptions opts = {});

    /** All five stages; the returned state carries the answer and new history. */
    PipelineState run(const std::string& query, const core::History& history);

    void retrieve(PipelineState& s);
    void analyze(PipelineState& s);
    void fetch_data(PipelineState& s) const;
    void analyze_data(PipelineState& s);
    static void update_history(PipelineState& s);

    const core::DecodedRecordSet& records() const noexcept { return *records_; }
    const PipelineOptions& options() const noexcept { return opts_; }

private:
    const core::SchemaCatalog&                    catalog_;
    llm::RetrievalService&                        retrieval_;
    llm::CompletionService&                       completion_;
    std::shared_ptr<const core::DecodedRecordSet> records_;
    PipelineOptions                               opts_;
};

} // namespace fchat::pipeline
