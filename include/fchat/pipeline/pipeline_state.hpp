#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/history.hpp"
#include "core/schema.hpp"
#include "core/value.hpp"

namespace fchat::pipeline
{

/** One `{message_type, required_fields}` pick of the analyze stage. */
struct Selection
{
    std::string              message_type;
    std::vector<std::string> required_fields;   ///< empty = every field

    bool operator==(const Selection&) const = default;
};

/** Schema and projected records of one selected message type. */
struct ScopedData
{
    core::SchemaEntry         schema;
    std::vector<core::Record> records;
};

/** Everything one chat turn accumulates, stage by stage. */
struct PipelineState
{
    std::string                    query;
    core::History                  history;
    std::vector<core::SchemaEntry> retrieved;
    std::vector<Selection>         selected;
    std::vector<std::pair<std::string, ScopedData>> fetched;   ///< selection order
    std::optional<std::string>     answer;
};

inline constexpr const char* kNoDataAnswer =
    "I couldn't find relevant data to answer your question.";

} // namespace fchat::pipeline
