#include "pipeline/prompts.hpp"
#include "core/errors.hpp"
#include "core/json_util.hpp"

#include <algorithm>
#include <sstream>

namespace fchat::pipeline {

std::string format_history(const core::History& history)
{
    if (history.empty()) return "No history";

    std::ostringstream oss;
    for (std::size_t i = 0; i < history.size(); ++i) {
        if (i) oss << '\n';
        oss << history[i].role << ": " << history[i].content;
    }
    return oss.str();
}

std::string build_analyze_prompt(const std::string& query,
                                 const std::vector<core::SchemaEntry>& retrieved,
                                 const core::History& history)
{
    std::ostringstream msgs;
    for (std::size_t i = 0; i < retrieved.size(); ++i) {
        const auto& e = retrieved[i];
        if (i) msgs << "\n\n";
        msgs << "### " << e.name << " ###\n"
             << "Description: " << e.description << "\n"
             << "Fields:";
        for (const auto& f : e.fields)
            msgs << "\n  • " << f.name << " (" << f.units << "): " << f.description;
    }

    std::ostringstream p;
    p << "<task>\n"
         "Work out which log message types (MessageName) and which of their fields\n"
         "are needed to answer the user's question about an ArduPilot flight log.\n"
         "Answer with a JSON array; each element is an object with\n"
         "- \"message_type\": the exact MessageName (e.g. \"GPS\")\n"
         "- \"required_fields\": exact field names needed from it (e.g. [\"TimeUS\", \"Alt\"])\n"
         "</task>\n\n"
      << "<user_query>\n" << query << "\n</user_query>\n\n"
      << "<available_messages>\n" << msgs.str() << "\n</available_messages>\n\n"
      << "<conversation_history>\n" << format_history(history) << "\n</conversation_history>\n\n"
      << "<instructions>\n"
         "- Output the JSON array only, no prose\n"
         "- Every object has both keys \"message_type\" and \"required_fields\"\n"
         "- List fields only when the question names them or clearly needs them;\n"
         "  otherwise use an empty list to get every field of the message\n"
         "- Use the conversation history to resolve follow-up questions\n"
         "- Put the most relevant message first\n"
         "</instructions>\n";
    return p.str();
}

std::string build_answer_context(const PipelineState& state, std::size_t samples)
{
    std::ostringstream c;

    if (state.history.empty())
        c << "# No conversation history";
    else
        c << "# Conversation History\n" << format_history(state.history);

    c << "\n\n\n# User Query\n" << state.query;
    c << "\n\n\n# Relevant Data Schemas and Samples";

    for (const auto& [type, data] : state.fetched) {
        const auto& schema  = data.schema;
        const auto& records = data.records;

        c << "\n\n## " << type << " Schema\n"
          << "Description: " << (schema.description.empty()
                                   ? "No description available" : schema.description) << "\n"
          << "Fields:";
        for (const auto& f : schema.fields)
            c << "\n- " << f.name << " (" << f.units << "): " << f.description;

        const std::size_t shown = std::min(samples, records.size());
        c << "\n\n### " << type << " Data Samples (showing " << shown
          << " of " << records.size() << " entries)";

        if (records.empty()) {
            c << "\nNo data available for this message type";
            continue;
        }
        for (std::size_t i = 0; i < shown; ++i) {
            c << "\nSample " << i + 1 << ':';
            for (const auto& f : records[i].fields())
                c << "\n  " << f.name << ": " << core::to_display(f.value);
        }
    }
    return c.str();
}

std::string build_answer_prompt(const std::string& context)
{
    std::ostringstream p;
    p << "<role>\n"
         "You are ArduPilot Analyst, an assistant that explains ArduPilot flight logs:\n"
         "flight performance, telemetry values and anything unusual in them.\n"
         "</role>\n\n"
      << "<context>\n" << context << "\n</context>\n\n"
      << "<instructions>\n"
         "1. Take the whole conversation into account\n"
         "2. Base the answer on the data samples above\n"
         "3. Give the direct answer first, then the supporting values\n"
         "4. Quote units from the schema with every value\n"
         "5. Say what is missing when the samples are not enough\n"
         "6. Suggest a follow-up question when it helps\n"
         "</instructions>\n\n"
         "Now answer the user:\n";
    return p.str();
}

std::vector<Selection> parse_selection(const std::string& completion)
{
    const auto first = completion.find('[');
    const auto last  = completion.rfind(']');
    if (first == std::string::npos || last == std::string::npos || last < first)
        throw CollaboratorFailure("analysis returned no JSON array");

    Json::Value doc;
    std::string err;
    if (!core::parse_json(std::string_view(completion).substr(first, last - first + 1), doc, &err)
        || !doc.isArray())
        throw CollaboratorFailure("analysis returned invalid JSON: " + err);

    std::vector<Selection> out;
    for (const auto& item : doc) {
        if (!item.isObject()) continue;
        const Json::Value& type   = item["message_type"];
        const Json::Value& fields = item["required_fields"];
        if (!type.isString() || !fields.isArray()) continue;

        Selection s;
        s.message_type = type.asString();
        for (const auto& f : fields)
            if (f.isString()) s.required_fields.push_back(f.asString());
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace fchat::pipeline
