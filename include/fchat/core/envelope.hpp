#pragma once
/**
 *  Transport envelope: JSON text frames exchanged with clients.
 *
 *  Inbound   {type, content, ...}         → Inbound (closed variant)
 *  Outbound  {type, content, timestamp}   ← Outbound::to_json()
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <json/json.h>

namespace fchat::core
{

struct FileChunk
{
    std::size_t          index = 0;
    std::size_t          total = 0;
    std::string          file_name;
    std::vector<uint8_t> bytes;
};

struct FileComplete
{
    std::string file_name;
    std::size_t total = 0;
};

struct ChatMessage
{
    std::string text;
};

/** Any other `type`; echoed back and rebroadcast verbatim. */
struct Passthrough
{
    Json::Value message;
};

using InboundBody = std::variant<FileChunk, FileComplete, ChatMessage, Passthrough>;

struct Inbound
{
    InboundBody body;
    std::string timestamp;   ///< set on arrival
};

/**
 *  Throws MalformedEnvelope: "Invalid message format. Please send valid JSON."
 *  for unparsable text, "Invalid message format: <detail>" for a missing or
 *  mistyped field.
 */
Inbound parse_envelope(std::string_view text);

enum class OutKind { System, Acknowledgment, Chat, Error };

const char* to_string(OutKind k) noexcept;

struct Outbound
{
    OutKind                    kind;
    std::string                content;
    std::optional<Json::Value> original_message;
    std::string                timestamp;

    Json::Value to_json() const;
};

/** Outbound stamped with the current local time. */
Outbound make_outbound(OutKind kind, std::string content);

} // namespace fchat::core
