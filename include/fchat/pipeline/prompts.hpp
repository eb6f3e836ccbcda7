#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "pipeline/pipeline_state.hpp"

namespace fchat::pipeline
{

/** "role: content" lines, or "No history". */
std::string format_history(const core::History& history);

/** Stage 2 prompt: pick message types and fields for the query. */
std::string build_analyze_prompt(const std::string& query,
                                 const std::vector<core::SchemaEntry>& retrieved,
                                 const core::History& history);

/** Stage 4 context: history, query, schemas and up to `samples` records per type. */
std::string build_answer_context(const PipelineState& state, std::size_t samples);

/** Stage 4 prompt wrapping the context. */
std::string build_answer_prompt(const std::string& context);

/**
 *  Reads the stage 2 completion: a JSON array, optionally inside a
 *  Markdown code fence. Items without `message_type` (string) or
 *  `required_fields` (array) are dropped.
 *  Throws fchat::CollaboratorFailure when no JSON array is found.
 */
std::vector<Selection> parse_selection(const std::string& completion);

} // namespace fchat::pipeline
