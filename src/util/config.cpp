#include "util/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace fchat::util {

std::string get_env(const std::string& name, const std::string& fallback)
{
    const char* value = std::getenv(name.c_str());
    return (value == nullptr || *value == '\0') ? fallback : std::string(value);
}

namespace {

unsigned long long env_number(const std::string& name, unsigned long long fallback,
                              unsigned long long min, unsigned long long max)
{
    const std::string raw = get_env(name, "");
    if (raw.empty()) return fallback;

    std::size_t pos = 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(raw, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(name + ": not a number: " + raw);
    }
    if (pos != raw.size() || v < min || v > max)
        throw std::runtime_error(name + ": out of range: " + raw);
    return v;
}

} // namespace

HistoryPolicy parse_history_policy(const std::string& s)
{
    if (s == "skip")   return HistoryPolicy::Skip;
    if (s == "record") return HistoryPolicy::Record;
    throw std::runtime_error("FCHAT_HISTORY_ON_FAILURE: expected skip|record, got " + s);
}

Config Config::from_env(bool require_completion)
{
    Config c;

    c.host = get_env("FCHAT_HOST", c.host);
    c.port = static_cast<uint16_t>(env_number("FCHAT_PORT", c.port, 1, 65535));

    const std::size_t hw = std::max<std::size_t>(2, std::thread::hardware_concurrency());
    c.workers = env_number("FCHAT_WORKERS", hw, 1, 256);

    c.upload_dir    = get_env("FCHAT_UPLOAD_DIR", c.upload_dir);
    c.processed_dir = get_env("FCHAT_PROCESSED_DIR", c.processed_dir);
    c.schema_file   = get_env("FCHAT_SCHEMA_FILE", c.schema_file);

    c.pg_conninfo = get_env("FCHAT_PG_CONNINFO", c.pg_conninfo);
    c.pg_pool     = env_number("FCHAT_PG_POOL", c.pg_pool, 1, 64);
    c.index_table = get_env("FCHAT_INDEX_TABLE", c.index_table);

    c.embedding_url   = get_env("EMBEDDING_URL", c.embedding_url);
    c.embedding_model = get_env("EMBEDDING_MODEL", c.embedding_model);
    c.embedding_key   = get_env("EMBEDDING_API_KEY", "");

    c.anthropic_key = get_env("ANTHROPIC_API_KEY", "");
    c.anthropic_url = get_env("ANTHROPIC_URL", c.anthropic_url);
    c.analyze_model = get_env("FCHAT_ANALYZE_MODEL", c.analyze_model);
    c.answer_model  = get_env("FCHAT_ANSWER_MODEL", c.answer_model);
    c.http_timeout_ms = static_cast<long>(
        env_number("FCHAT_HTTP_TIMEOUT_MS", c.http_timeout_ms, 1000, 600000));

    c.history_on_failure = parse_history_policy(get_env("FCHAT_HISTORY_ON_FAILURE", "skip"));
    c.max_message_bytes  = env_number("FCHAT_MAX_MESSAGE_BYTES", c.max_message_bytes,
                                      1024, 1ull << 30);

    if (require_completion && c.anthropic_key.empty())
        throw std::runtime_error("ANTHROPIC_API_KEY environment variable is not set");

    return c;
}

} // namespace fchat::util
