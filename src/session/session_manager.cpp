#include "session/session_manager.hpp"
#include "core/errors.hpp"
#include "decode/processed_writer.hpp"
#include "session/upload_store.hpp"

#include <iostream>

namespace fchat::session {

SessionManager::SessionManager(const core::SchemaCatalog& catalog,
                               llm::RetrievalService& retrieval,
                               llm::CompletionService& completion,
                               decode::LogDecoder& decoder,
                               StorageOptions storage,
                               pipeline::PipelineOptions pipeline_opts,
                               util::HistoryPolicy on_failure)
    : catalog_(catalog),
      retrieval_(retrieval),
      completion_(completion),
      decoder_(decoder),
      storage_(std::move(storage)),
      pipeline_opts_(std::move(pipeline_opts)),
      on_failure_(on_failure)
{}

/* ------------------------------------------------------------------ */
/*  Registry                                                           */
/* ------------------------------------------------------------------ */
SessionPtr SessionManager::find(const std::string& id) const
{
    std::lock_guard lk(m_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

SessionPtr SessionManager::acquire(const std::string& id) const
{
    auto s = find(id);
    if (!s) throw UnknownSession(id);
    return s;
}

void SessionManager::open(const std::string& id)
{
    auto fresh = std::make_shared<Session>(id);
    SessionPtr old;
    {
        std::lock_guard lk(m_);
        auto& slot = sessions_[id];
        old = std::move(slot);
        slot = std::move(fresh);
    }
    if (old) old->closed = true;
    std::cout << "[SESSION] open " << id << '\n';
}

void SessionManager::close(const std::string& id)
{
    SessionPtr s;
    {
        std::lock_guard lk(m_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        s = std::move(it->second);
        sessions_.erase(it);
    }
    s->closed = true;

    std::lock_guard lk(s->m);
    s->transfer.reset({}, 0);
    s->pipeline.reset();
    s->history.clear();
    std::cout << "[SESSION] closed " << id << '\n';
}

bool SessionManager::contains(const std::string& id) const
{
    return find(id) != nullptr;
}

bool SessionManager::has_pipeline(const std::string& id) const
{
    auto s = find(id);
    if (!s) return false;
    std::lock_guard lk(s->m);
    return s->pipeline != nullptr;
}

core::History SessionManager::history(const std::string& id) const
{
    auto s = acquire(id);
    std::lock_guard lk(s->m);
    return s->history;
}

std::optional<std::filesystem::path> SessionManager::file_path(const std::string& id) const
{
    auto s = acquire(id);
    std::lock_guard lk(s->m);
    return s->file_path;
}

std::size_t SessionManager::size() const
{
    std::lock_guard lk(m_);
    return sessions_.size();
}

/* ------------------------------------------------------------------ */
/*  Upload                                                             */
/* ------------------------------------------------------------------ */
ChunkAck SessionManager::receive_chunk(const std::string& id, std::size_t index,
                                       std::vector<uint8_t> payload,
                                       const std::string& file_name,
                                       std::size_t total_expected)
{
    auto s = acquire(id);
    std::lock_guard lk(s->m);

    auto& t = s->transfer;
    if (t.file_name != file_name || t.total != total_expected)
        t.reset(file_name, total_expected);

    t.chunks[index] = std::move(payload);
    return {index, total_expected};
}

TransferResult SessionManager::complete_transfer(const std::string& id,
                                                 const std::string& file_name,
                                                 std::size_t total_expected)
{
    return bind_upload(take_upload(acquire(id), file_name, total_expected));
}

PendingUpload SessionManager::take_upload(const SessionPtr& s,
                                          const std::string& file_name,
                                          std::size_t total_expected)
{
    PendingUpload up{s, file_name, {}};

    std::lock_guard lk(s->m);
    auto& t = s->transfer;

    if (t.file_name != file_name) {
        std::cerr << "[UPLOAD] " << s->id << ": completion for " << file_name
                  << " but buffered chunks belong to '" << t.file_name << "'\n";
        throw IncompleteTransfer(0, total_expected);
    }
    if (t.chunks.size() != total_expected)
        throw IncompleteTransfer(t.chunks.size(), total_expected);

    std::size_t sz = 0;
    for (std::size_t i = 0; i < total_expected; ++i) {
        auto it = t.chunks.find(i);
        if (it == t.chunks.end())
            throw MissingChunk(i);
        sz += it->second.size();
    }

    up.bytes.reserve(sz);
    for (std::size_t i = 0; i < total_expected; ++i) {
        const auto& c = t.chunks[i];
        up.bytes.insert(up.bytes.end(), c.begin(), c.end());
    }
    t.reset({}, 0);
    return up;
}

TransferResult SessionManager::bind_upload(PendingUpload up)
{
    auto& s = up.session;

    TransferResult res;
    res.saved = save_upload(storage_.upload_dir, up.file_name, up.bytes);
    up.bytes.clear();
    up.bytes.shrink_to_fit();

    std::shared_ptr<pipeline::QueryPipeline> pipe;
    try {
        auto decoded = decoder_.decode(res.saved);
        if (decoded.empty())
            throw DecodeFailure("no messages decoded");
        res.processed = decode::write_processed(decoded, storage_.processed_dir, res.saved);

        auto records = std::make_shared<const core::DecodedRecordSet>(std::move(decoded));
        pipe = std::make_shared<pipeline::QueryPipeline>(
            catalog_, retrieval_, completion_, std::move(records), pipeline_opts_);
    }
    catch (const std::exception& e) {
        res.processed.reset();
        res.decode_error = e.what();
        std::cerr << "[DECODE] " << res.saved.string() << ": " << e.what() << '\n';
    }

    std::lock_guard lk(s->m);
    if (s->closed) return res;

    s->file_path      = res.saved;
    s->processed_path = res.processed;
    s->pipeline       = std::move(pipe);
    if (s->pipeline)
        std::cout << "[SESSION] " << s->id << " bound to " << res.saved.filename().string()
                  << " (" << s->pipeline->records().type_count() << " message types)\n";
    return res;
}

/* ------------------------------------------------------------------ */
/*  Chat                                                               */
/* ------------------------------------------------------------------ */
std::string SessionManager::run_turn(const std::string& id, const std::string& query)
{
    return run_turn(acquire(id), query);
}

std::string SessionManager::run_turn(const SessionPtr& s, const std::string& query,
                                     const std::function<void()>& on_started)
{
    std::shared_ptr<pipeline::QueryPipeline> pipe;
    core::History snapshot;
    {
        std::lock_guard lk(s->m);
        if (!s->pipeline) throw NoPipelineBound();
        pipe     = s->pipeline;
        snapshot = s->history;
    }
    if (on_started) on_started();

    try {
        auto state = pipe->run(query, snapshot);

        std::lock_guard lk(s->m);
        if (!s->closed)
            s->history = std::move(state.history);
        return state.answer.value_or(std::string{});
    }
    catch (const std::exception& e) {
        if (on_failure_ == util::HistoryPolicy::Record) {
            std::lock_guard lk(s->m);
            if (!s->closed) {
                s->history.push_back({"user", query});
                s->history.push_back({"assistant", e.what()});
            }
        }
        throw;
    }
}

} // namespace fchat::session
