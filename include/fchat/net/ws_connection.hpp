#pragma once
#include <asio.hpp>
#include <array>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "net/ws_frame.hpp"
#include "net/ws_handshake.hpp"

namespace fchat::net
{

class WsServer;

/**
 *  One TCP connection: HTTP request → (plain JSON reply | WebSocket).
 *  All members are touched on the io_context thread only.
 */
class WsConnection : public std::enable_shared_from_this<WsConnection>
{
public:
    WsConnection(asio::ip::tcp::socket&& sock, WsServer& server);

    void start();

    /** Queues one text frame; ignored once closing. */
    void send_text(const std::string& text);

    /** Sends a close frame, then shuts the socket down after pending writes. */
    void close(uint16_t code, const std::string& reason = {});

    /** Closes the socket at once, dropping queued writes. */
    void abort();

    bool is_websocket() const noexcept { return open_; }
    const std::string& client_id() const noexcept { return id_; }

private:
    void read_request();
    void handle_request(std::size_t head_len);
    void reply_and_close(int status, const std::string& json_body);
    void accept_upgrade(const HttpRequest& req, const std::string& id);

    void read_frames();
    void handle_message(WsMessage& msg);

    void queue(std::vector<uint8_t> bytes);
    void write_next();
    void shutdown();
    void finish();

    asio::ip::tcp::socket             socket_;
    WsServer&                         server_;
    asio::streambuf                   request_buf_;
    std::array<uint8_t, 16384>        rx_{};
    FrameReader                       reader_;
    std::deque<std::vector<uint8_t>>  tx_;
    std::string                       id_;
    std::string                       remote_;

    bool open_     = false;   // registered WebSocket session
    bool closing_  = false;
    bool writing_  = false;
    bool finished_ = false;
};

} // namespace fchat::net
