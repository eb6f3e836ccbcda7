#pragma once
/**
 *  Registry of live sessions and the chunked-upload protocol.
 *
 *  Upload:  receive_chunk()* → complete_transfer()
 *           = take_upload()  file name must match the buffered transfer and
 *                            the count of distinct indices must equal the
 *                            declared total; payloads are concatenated
 *                            by index 0..total-1
 *           + bind_upload()  the file is saved, decoded, and a fresh
 *                            QueryPipeline is bound to the records
 *  Chat:    run_turn(): needs a bound pipeline
 *
 *  Calls for different sessions may run concurrently. Calls for one
 *  session are expected to come in order (see util::SessionExecutor);
 *  the per-session mutex only protects the state itself. The SessionPtr
 *  overloads pin the Session object a job was started for, so a result
 *  never lands on a newer session that reuses the id.
 */
#include <functional>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/history.hpp"
#include "core/schema.hpp"
#include "decode/log_decoder.hpp"
#include "llm/services.hpp"
#include "pipeline/query_pipeline.hpp"
#include "session/session.hpp"
#include "util/config.hpp"

namespace fchat::session
{

struct ChunkAck
{
    std::size_t index;
    std::size_t total;
};

struct TransferResult
{
    std::filesystem::path                saved;
    std::optional<std::filesystem::path> processed;     ///< empty when decode failed
    std::string                          decode_error;
};

using SessionPtr = std::shared_ptr<Session>;

/** Reassembled bytes detached from the session's chunk buffer. */
struct PendingUpload
{
    SessionPtr           session;
    std::string          file_name;
    std::vector<uint8_t> bytes;
};

struct StorageOptions
{
    std::filesystem::path upload_dir    = "./uploads";
    std::filesystem::path processed_dir = "./processed";
};

class SessionManager
{
public:
    SessionManager(const core::SchemaCatalog& catalog,
                   llm::RetrievalService& retrieval,
                   llm::CompletionService& completion,
                   decode::LogDecoder& decoder,
                   StorageOptions storage = {},
                   pipeline::PipelineOptions pipeline_opts = {},
                   util::HistoryPolicy on_failure = util::HistoryPolicy::Skip);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /** New session with a greeting-only history; replaces any session with that id. */
    void open(const std::string& id);

    /** Stores the payload under `index` (overwriting a duplicate). */
    ChunkAck receive_chunk(const std::string& id, std::size_t index,
                           std::vector<uint8_t> payload,
                           const std::string& file_name, std::size_t total_expected);

    /** Throws UnknownSession. */
    SessionPtr acquire(const std::string& id) const;

    /**
     *  Reassembles, saves and decodes the upload.
     *  Throws IncompleteTransfer / MissingChunk (buffer kept for a retry),
     *  UnknownSession, or fchat::Error if the file can't be written.
     *  A decode failure is reported in the result, not thrown.
     */
    TransferResult complete_transfer(const std::string& id,
                                     const std::string& file_name,
                                     std::size_t total_expected);

    /**
     *  Reassembly half of complete_transfer(); clears the buffer on success.
     *  A `file_name` other than the buffered transfer's is IncompleteTransfer.
     */
    PendingUpload take_upload(const SessionPtr& s, const std::string& file_name,
                              std::size_t total_expected);

    /** Save/decode half of complete_transfer(); no-op binding if the session closed. */
    TransferResult bind_upload(PendingUpload upload);

    /**
     *  One pipeline turn; returns the answer.
     *  Throws NoPipelineBound, UnknownSession or CollaboratorFailure.
     *  `on_started` runs once the pipeline check has passed.
     */
    std::string run_turn(const std::string& id, const std::string& query);
    std::string run_turn(const SessionPtr& s, const std::string& query,
                         const std::function<void()>& on_started = {});

    /** Releases everything the session owns; no-op for unknown ids. */
    void close(const std::string& id);

    bool contains(const std::string& id) const;
    bool has_pipeline(const std::string& id) const;
    core::History history(const std::string& id) const;
    std::optional<std::filesystem::path> file_path(const std::string& id) const;
    std::size_t size() const;

private:
    SessionPtr find(const std::string& id) const;

    const core::SchemaCatalog&  catalog_;
    llm::RetrievalService&      retrieval_;
    llm::CompletionService&     completion_;
    decode::LogDecoder&         decoder_;
    StorageOptions              storage_;
    pipeline::PipelineOptions   pipeline_opts_;
    util::HistoryPolicy         on_failure_;

    mutable std::mutex                                        m_;
    std::unordered_map<std::string, SessionPtr>               sessions_;
};

} // namespace fchat::session
