#include "net/ws_connection.hpp"
#include "net/ws_server.hpp"
#include "util/clock.hpp"

#include <iostream>

namespace fchat::net {

WsConnection::WsConnection(asio::ip::tcp::socket&& sock, WsServer& server)
    : socket_(std::move(sock)),
      server_(server),
      request_buf_(kMaxRequestHead),
      reader_(server.max_message_bytes())
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if (!ec)
        remote_ = ep.address().to_string() + ':' + std::to_string(ep.port());
}

void WsConnection::start()
{
    read_request();
}

/* ─────────────────────────────────────────────────────────── */
/*  HTTP                                                       */
/* ─────────────────────────────────────────────────────────── */

void WsConnection::read_request()
{
    asio::async_read_until(
        socket_, request_buf_, "\r\n\r\n",
        [self = shared_from_this()](std::error_code ec, std::size_t n) {
            if (ec == asio::error::not_found) {
                self->reply_and_close(431, R"({"detail":"Request header too large"})");
                return;
            }
            if (ec) {
                self->shutdown();
                return;
            }
            self->handle_request(n);
        });
}

void WsConnection::handle_request(std::size_t head_len)
{
    auto begin = asio::buffers_begin(request_buf_.data());
    const std::string head(begin, begin + static_cast<std::ptrdiff_t>(head_len));
    request_buf_.consume(head_len);

    auto req = parse_request(head);
    if (!req) {
        reply_and_close(400, R"({"detail":"Bad Request"})");
        return;
    }

    const std::string path = req->target.substr(0, req->target.find('?'));

    if (auto id = client_id_from_target(req->target)) {
        if (!is_websocket_upgrade(*req)) {
            reply_and_close(426, R"({"detail":"WebSocket upgrade required"})");
            return;
        }
        if (server_.is_live(*id)) {
            std::cerr << "[WS] refused duplicate client id " << *id << " from " << remote_ << '\n';
            reply_and_close(409, R"({"detail":"Client ID already connected"})");
            return;
        }
        accept_upgrade(*req, *id);
        return;
    }

    if (req->method != "GET") {
        reply_and_close(405, R"({"detail":"Method Not Allowed"})");
        return;
    }
    if (path == "/health") {
        reply_and_close(200, R"({"status":"healthy","timestamp":")" + util::iso_timestamp() + "\"}");
        return;
    }
    if (path == "/") {
        reply_and_close(200, R"({"message":"Welcome to UAV Log Viewer API"})");
        return;
    }
    reply_and_close(404, R"({"detail":"Not Found"})");
}

void WsConnection::reply_and_close(int status, const std::string& json_body)
{
    const std::string r = json_response(status, json_body);
    closing_ = true;
    queue(std::vector<uint8_t>(r.begin(), r.end()));
}

void WsConnection::accept_upgrade(const HttpRequest& req, const std::string& id)
{
    std::string accept;
    try {
        accept = accept_key(req.header("sec-websocket-key"));
    } catch (const std::exception& e) {
        std::cerr << "[WS] handshake failed: " << e.what() << '\n';
        reply_and_close(500, R"({"detail":"Handshake failed"})");
        return;
    }

    const std::string r = switching_protocols(accept);
    queue(std::vector<uint8_t>(r.begin(), r.end()));

    id_   = id;
    open_ = server_.register_client(id_, shared_from_this());
    std::cout << "[WS] new connection " << id_ << " from " << remote_ << '\n';

    try {
        server_.endpoint().on_open(id_);
    } catch (const std::exception& e) {
        std::cerr << "[WS] on_open failed for " << id_ << ": " << e.what() << '\n';
        close(close_code::Internal, "session setup failed");
        return;
    }

    // bytes that arrived right behind the request head
    if (request_buf_.size() > 0) {
        auto b = asio::buffers_begin(request_buf_.data());
        std::vector<uint8_t> extra(b, b + static_cast<std::ptrdiff_t>(request_buf_.size()));
        request_buf_.consume(request_buf_.size());
        reader_.feed(extra.data(), extra.size());
    }

    try {
        while (auto msg = reader_.next())
            handle_message(*msg);
    } catch (const FrameError& e) {
        std::cerr << "[WS] " << id_ << ": " << e.what() << '\n';
        close(e.code(), e.what());
        return;
    }
    read_frames();
}

/* ─────────────────────────────────────────────────────────── */
/*  WebSocket                                                  */
/* ─────────────────────────────────────────────────────────── */

void WsConnection::read_frames()
{
    if (closing_) return;

    socket_.async_read_some(
        asio::buffer(rx_),
        [self = shared_from_this()](std::error_code ec, std::size_t n) {
            if (ec) {
                if (ec != asio::error::eof && ec != asio::error::operation_aborted)
                    std::cerr << "[WS] read error on " << self->id_ << ": " << ec.message() << '\n';
                self->shutdown();
                return;
            }

            self->reader_.feed(self->rx_.data(), n);
            try {
                while (auto msg = self->reader_.next()) {
                    self->handle_message(*msg);
                    if (self->closing_) return;
                }
            } catch (const FrameError& e) {
                std::cerr << "[WS] " << self->id_ << ": " << e.what() << '\n';
                self->close(e.code(), e.what());
                return;
            }
            self->read_frames();
        });
}

void WsConnection::handle_message(WsMessage& msg)
{
    switch (msg.opcode) {
    case Opcode::Text:
        server_.endpoint().on_message(id_, msg.payload);
        break;
    case Opcode::Binary:
        close(close_code::Unsupported, "text frames only");
        break;
    case Opcode::Ping:
        queue(encode_frame(Opcode::Pong, msg.payload));
        break;
    case Opcode::Pong:
        break;
    case Opcode::Close: {
        uint16_t code = parse_close_code(msg.payload);
        if (code == 1005) code = close_code::Normal;
        close(code);
        break;
    }
    case Opcode::Continuation:
        break;
    }
}

void WsConnection::send_text(const std::string& text)
{
    if (!open_ || closing_) return;
    queue(encode_frame(Opcode::Text, text));
}

void WsConnection::close(uint16_t code, const std::string& reason)
{
    if (closing_) return;
    closing_ = true;
    if (open_)
        queue(encode_close(code, reason));
    else
        shutdown();
}

void WsConnection::abort()
{
    closing_ = true;
    shutdown();
}

/* ─────────────────────────────────────────────────────────── */
/*  Write queue                                                */
/* ─────────────────────────────────────────────────────────── */

void WsConnection::queue(std::vector<uint8_t> bytes)
{
    if (finished_) return;
    tx_.push_back(std::move(bytes));
    if (!writing_) write_next();
}

void WsConnection::write_next()
{
    if (finished_) {
        tx_.clear();
        writing_ = false;
        return;
    }
    if (tx_.empty()) {
        writing_ = false;
        if (closing_) shutdown();
        return;
    }

    writing_ = true;
    asio::async_write(
        socket_, asio::buffer(tx_.front()),
        [self = shared_from_this()](std::error_code ec, std::size_t) {
            if (ec) {
                std::cerr << "[WS] write error on " << self->id_ << ": " << ec.message() << '\n';
                self->tx_.clear();
                self->writing_ = false;
                self->shutdown();
                return;
            }
            self->tx_.pop_front();
            self->write_next();
        });
}

void WsConnection::shutdown()
{
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    finish();
}

void WsConnection::finish()
{
    if (finished_) return;
    finished_ = true;
    if (!writing_) tx_.clear();
    if (!open_) return;

    open_ = false;
    server_.unregister_client(id_, this);
    try {
        server_.endpoint().on_close(id_);
    } catch (const std::exception& e) {
        std::cerr << "[WS] on_close failed for " << id_ << ": " << e.what() << '\n';
    }
}

} // namespace fchat::net
