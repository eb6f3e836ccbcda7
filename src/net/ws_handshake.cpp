#include "net/ws_handshake.hpp"
#include "core/base64.hpp"
#include "core/errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>

namespace fchat::net {

namespace {

constexpr std::string_view kWsGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

/** true if the comma-separated header value lists `token` (case-insensitive) */
bool has_token(const std::string& value, std::string_view token)
{
    std::string_view rest = value;
    while (!rest.empty()) {
        auto comma = rest.find(',');
        auto part  = trim(rest.substr(0, comma));
        if (lower(part) == token) return true;
        if (comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }
    return false;
}

const char* reason_phrase(int status)
{
    switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 426: return "Upgrade Required";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    default:  return "Error";
    }
}

} // namespace

std::string HttpRequest::header(const std::string& lower_name) const
{
    auto it = headers.find(lower_name);
    return it == headers.end() ? std::string{} : it->second;
}

std::optional<HttpRequest> parse_request(std::string_view head)
{
    HttpRequest req;

    auto eol = head.find("\r\n");
    if (eol == std::string_view::npos) return std::nullopt;
    std::string_view line = head.substr(0, eol);
    head.remove_prefix(eol + 2);

    auto sp1 = line.find(' ');
    auto sp2 = line.rfind(' ');
    if (sp1 == std::string_view::npos || sp2 == sp1) return std::nullopt;
    req.method  = std::string(line.substr(0, sp1));
    req.target  = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));
    req.version = std::string(line.substr(sp2 + 1));
    if (req.target.empty() || req.version.rfind("HTTP/1.", 0) != 0) return std::nullopt;

    while (!head.empty()) {
        eol = head.find("\r\n");
        line = head.substr(0, eol);
        head.remove_prefix(eol == std::string_view::npos ? head.size() : eol + 2);
        if (line.empty()) break;

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) return std::nullopt;
        req.headers[lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
    }
    return req;
}

bool is_websocket_upgrade(const HttpRequest& req)
{
    return req.method == "GET"
        && has_token(req.header("upgrade"), "websocket")
        && has_token(req.header("connection"), "upgrade")
        && req.header("sec-websocket-version") == "13"
        && !req.header("sec-websocket-key").empty();
}

std::optional<std::string> client_id_from_target(std::string_view target)
{
    target = target.substr(0, target.find('?'));
    constexpr std::string_view prefix = "/ws/";
    if (target.substr(0, prefix.size()) != prefix) return std::nullopt;

    auto id = target.substr(prefix.size());
    if (id.empty() || id.find('/') != std::string_view::npos) return std::nullopt;
    return std::string(id);
}

std::string accept_key(std::string_view client_key)
{
    std::string in(client_key);
    in += kWsGuid;

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int  md_len = 0;
    if (EVP_Digest(in.data(), in.size(), md, &md_len, EVP_sha1(), nullptr) != 1)
        throw Error("SHA1 digest failed");
    return core::base64_encode(md, md_len);
}

std::string switching_protocols(std::string_view accept)
{
    std::string r = "HTTP/1.1 101 Switching Protocols\r\n"
                    "Upgrade: websocket\r\n"
                    "Connection: Upgrade\r\n"
                    "Sec-WebSocket-Accept: ";
    r += accept;
    r += "\r\n\r\n";
    return r;
}

std::string json_response(int status, std::string_view json_body)
{
    std::string r = "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n";
    r += "Content-Type: application/json\r\n";
    r += "Content-Length: " + std::to_string(json_body.size()) + "\r\n";
    r += "Connection: close\r\n\r\n";
    r += json_body;
    return r;
}

} // namespace fchat::net
