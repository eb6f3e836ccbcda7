#include "pipeline/query_pipeline.hpp"
#include "pipeline/prompts.hpp"
#include "core/errors.hpp"
#include "core/json_util.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace fchat::pipeline {

namespace {

/** Collaborator errors of a stage surface as CollaboratorFailure. */
template<typename F>
void guarded(const char* stage, F&& f)
{
    try {
        f();
    } catch (const CollaboratorFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw CollaboratorFailure(std::string(stage) + ": " + e.what());
    }
}

} // namespace

QueryPipeline::QueryPipeline(const core::SchemaCatalog& catalog,
                             llm::RetrievalService& retrieval,
                             llm::CompletionService& completion,
                             std::shared_ptr<const core::DecodedRecordSet> records,
                             PipelineOptions opts)
    : catalog_(catalog), retrieval_(retrieval), completion_(completion),
      records_(std::move(records)), opts_(std::move(opts))
{
    if (!records_)
        throw std::invalid_argument("QueryPipeline: record set is null");
}

PipelineState QueryPipeline::run(const std::string& query, const core::History& history)
{
    auto t0 = std::chrono::steady_clock::now();

    PipelineState s;
    s.query   = query;
    s.history = history;

    guarded("retrieve", [&] { retrieve(s); });
    guarded("analyze",  [&] { analyze(s); });
    fetch_data(s);
    if (!s.answer)
        guarded("analyze_data", [&] { analyze_data(s); });
    update_history(s);

    auto dt = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::steady_clock::now() - t0).count();
    std::cout << "[PIPELINE] Turn done in " << dt << " ms\n";
    return s;
}

/* 1. retrieve ─────────────────────────────────────────────── */

void QueryPipeline::retrieve(PipelineState& s)
{
    const auto matches = retrieval_.search(s.query, opts_.top_k);

    s.retrieved.clear();
    for (const auto& m : matches) {
        auto name   = m.metadata.find("MessageName");
        auto desc   = m.metadata.find("Description");
        auto fields = m.metadata.find("Fields");
        if (name == m.metadata.end() || desc == m.metadata.end() || fields == m.metadata.end())
            continue;

        Json::Value obj(Json::objectValue);
        obj["MessageName"] = name->second;
        obj["Description"] = desc->second;
        if (!core::parse_json(fields->second, obj["Fields"]))
            continue;

        if (auto e = core::parse_schema_entry(obj))
            s.retrieved.push_back(std::move(*e));
    }

    std::cout << "[PIPELINE] Retrieved " << s.retrieved.size() << '/' << matches.size()
              << " schema entries\n";
}

/* 2. analyze ──────────────────────────────────────────────── */

void QueryPipeline::analyze(PipelineState& s)
{
    const std::string prompt = build_analyze_prompt(s.query, s.retrieved, s.history);
    s.selected = parse_selection(completion_.complete(prompt, opts_.analyze));

    std::cout << "[PIPELINE] Selected " << s.selected.size() << " message types\n";
}

/* 3. fetch data ───────────────────────────────────────────── */

void QueryPipeline::fetch_data(PipelineState& s) const
{
    s.fetched.clear();

    if (s.selected.empty()) {
        s.answer = kNoDataAnswer;
        return;
    }

    for (const auto& sel : s.selected) {
        ScopedData data;
        const core::SchemaEntry* schema = catalog_.find(sel.message_type);
        data.schema = schema ? *schema : core::schema_not_found(sel.message_type);

        if (const auto* rows = records_->find(sel.message_type)) {
            data.records.reserve(rows->size());
            for (const auto& r : *rows)
                data.records.push_back(core::project(r, sel.required_fields));
        }

        // a type selected twice keeps its first position, the last field list wins
        auto it = std::find_if(s.fetched.begin(), s.fetched.end(),
                               [&](const auto& p) { return p.first == sel.message_type; });
        if (it != s.fetched.end())
            it->second = std::move(data);
        else
            s.fetched.emplace_back(sel.message_type, std::move(data));
    }
}

/* 4. analyze data ─────────────────────────────────────────── */

void QueryPipeline::analyze_data(PipelineState& s)
{
    const std::string context = build_answer_context(s, opts_.samples);
    s.answer = completion_.complete(build_answer_prompt(context), opts_.answer);
}

/* 5. update history ───────────────────────────────────────── */

void QueryPipeline::update_history(PipelineState& s)
{
    s.history.push_back(core::Message{"user", s.query});
    s.history.push_back(core::Message{"assistant", s.answer.value_or("")});
}

} // namespace fchat::pipeline
