#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/history.hpp"
#include "pipeline/query_pipeline.hpp"

namespace fchat::session
{

/** Chunks of the one in-flight upload, keyed by index. */
struct Transfer
{
    std::string                                  file_name;
    std::size_t                                  total = 0;
    std::map<std::size_t, std::vector<uint8_t>>  chunks;

    void reset(std::string name, std::size_t expected)
    {
        file_name = std::move(name);
        total     = expected;
        chunks.clear();
    }
};

/**
 *  Per-connection state. Owned by SessionManager; every field below
 *  `m` is guarded by it. A closed session never comes back: jobs that
 *  still hold it check `closed` before applying results.
 */
struct Session
{
    explicit Session(std::string sid) : id(std::move(sid))
    {
        history.push_back(core::Message{"assistant", core::kGreeting});
    }

    const std::string id;
    std::atomic<bool> closed{false};

    std::mutex                                      m;
    Transfer                                        transfer;
    std::optional<std::filesystem::path>            file_path;
    std::optional<std::filesystem::path>            processed_path;
    std::shared_ptr<pipeline::QueryPipeline>        pipeline;
    core::History                                   history;
};

} // namespace fchat::session
