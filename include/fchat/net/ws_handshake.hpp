#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace fchat::net
{

constexpr std::size_t kMaxRequestHead = 8192;

struct HttpRequest
{
    std::string method;
    std::string target;
    std::string version;
    std::map<std::string, std::string> headers;   ///< lower-case names

    /** Header value or "" */
    std::string header(const std::string& lower_name) const;
};

/** Parses the request line and headers (up to the blank line); nullopt if malformed. */
std::optional<HttpRequest> parse_request(std::string_view head);

/** GET with Upgrade: websocket, Connection: upgrade, version 13 and a key. */
bool is_websocket_upgrade(const HttpRequest& req);

/** `<id>` of "/ws/<id>" (query string ignored); nullopt for other paths. */
std::optional<std::string> client_id_from_target(std::string_view target);

/** base64(SHA1(key + RFC 6455 GUID)) */
std::string accept_key(std::string_view client_key);

std::string switching_protocols(std::string_view accept);

/** Complete HTTP/1.1 response with a JSON body; the connection is closed after it. */
std::string json_response(int status, std::string_view json_body);

} // namespace fchat::net
