#include "core/envelope.hpp"
#include "core/base64.hpp"
#include "core/errors.hpp"
#include "core/json_util.hpp"
#include "util/clock.hpp"

namespace fchat::core {

namespace {

[[noreturn]] void bad(const std::string& detail)
{
    throw MalformedEnvelope("Invalid message format: " + detail);
}

const Json::Value& member(const Json::Value& obj, const char* key, const char* where)
{
    if (!obj.isObject() || !obj.isMember(key))
        bad(std::string(where) + " missing '" + key + "'");
    return obj[key];
}

std::size_t as_count(const Json::Value& v, const char* key)
{
    if (!v.isIntegral() || (v.isInt64() && v.asInt64() < 0))
        bad(std::string("'") + key + "' must be a non-negative integer");
    return static_cast<std::size_t>(v.asUInt64());
}

std::string as_text(const Json::Value& v, const char* key)
{
    if (!v.isString())
        bad(std::string("'") + key + "' must be a string");
    return v.asString();
}

FileChunk parse_chunk(const Json::Value& c)
{
    FileChunk out;
    out.index     = as_count(member(c, "chunkIndex",  "file_chunk"), "chunkIndex");
    out.total     = as_count(member(c, "totalChunks", "file_chunk"), "totalChunks");
    out.file_name = as_text (member(c, "fileName",    "file_chunk"), "fileName");
    try {
        out.bytes = base64_decode(as_text(member(c, "data", "file_chunk"), "data"));
    } catch (const std::invalid_argument& e) {
        bad(std::string("'data' is not base64 (") + e.what() + ")");
    }
    return out;
}

FileComplete parse_complete(const Json::Value& c)
{
    FileComplete out;
    out.file_name = as_text (member(c, "fileName",    "file_complete"), "fileName");
    out.total     = as_count(member(c, "totalChunks", "file_complete"), "totalChunks");
    return out;
}

} // namespace

Inbound parse_envelope(std::string_view text)
{
    Json::Value root;
    if (!parse_json(text, root))
        throw MalformedEnvelope("Invalid message format. Please send valid JSON.");
    if (!root.isObject())
        bad("expected a JSON object");

    Inbound in;
    in.timestamp = util::iso_timestamp();

    const std::string type = as_text(member(root, "type", "envelope"), "type");

    if (type == "file_chunk")
        in.body = parse_chunk(member(root, "content", "file_chunk"));
    else if (type == "file_complete")
        in.body = parse_complete(member(root, "content", "file_complete"));
    else if (type == "chat")
        in.body = ChatMessage{as_text(member(root, "content", "chat"), "content")};
    else {
        root["timestamp"] = in.timestamp;
        in.body = Passthrough{std::move(root)};
    }
    return in;
}

const char* to_string(OutKind k) noexcept
{
    switch (k) {
    case OutKind::System:         return "system";
    case OutKind::Acknowledgment: return "acknowledgment";
    case OutKind::Chat:           return "chat";
    case OutKind::Error:          return "error";
    }
    return "error";
}

Json::Value Outbound::to_json() const
{
    Json::Value v(Json::objectValue);
    v["type"]      = to_string(kind);
    v["content"]   = content;
    v["timestamp"] = timestamp;
    if (original_message)
        v["original_message"] = *original_message;
    return v;
}

Outbound make_outbound(OutKind kind, std::string content)
{
    return Outbound{kind, std::move(content), std::nullopt, util::iso_timestamp()};
}

} // namespace fchat::core
