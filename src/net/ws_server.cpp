#include "net/ws_server.hpp"
#include "core/json_util.hpp"

#include <algorithm>
#include <iostream>

namespace fchat::net {

WsServer::WsServer(asio::io_context& io, const std::string& host, uint16_t port,
                   std::size_t max_message_bytes)
    : io_(io),
      acceptor_(io, asio::ip::tcp::endpoint(asio::ip::make_address(host), port)),
      max_message_(max_message_bytes),
      drain_timer_(io)
{}

uint16_t WsServer::port() const
{
    return acceptor_.local_endpoint().port();
}

void WsServer::start(Endpoint& ep)
{
    endpoint_ = &ep;
    std::cout << "[WS] listening on " << acceptor_.local_endpoint().address().to_string()
              << ':' << port() << '\n';
    start_accept();
}

void WsServer::stop()
{
    asio::post(io_, [this] {
        stopping_ = true;
        std::error_code ec;
        acceptor_.close(ec);

        std::vector<std::shared_ptr<WsConnection>> live;
        for (auto& weak : conns_)
            if (auto c = weak.lock())
                live.push_back(std::move(c));
        conns_.clear();

        for (auto& c : live) {
            if (c->is_websocket())
                c->close(close_code::GoingAway, "server shutdown");
            else
                c->abort();
        }
        if (clients_.empty()) return;

        std::cout << "[WS] draining " << clients_.size() << " connections\n";
        drain_timer_.expires_after(kDrainTimeout);
        drain_timer_.async_wait([this](std::error_code ec) {
            if (ec) return;
            std::cerr << "[WS] drain timed out, dropping " << clients_.size() << " connections\n";
            std::vector<std::shared_ptr<WsConnection>> left;
            for (auto& [id, weak] : clients_)
                if (auto c = weak.lock())
                    left.push_back(std::move(c));
            for (auto& c : left)
                c->abort();
        });
    });
}

void WsServer::start_accept()
{
    acceptor_.async_accept(
        [this](std::error_code ec, asio::ip::tcp::socket sock) {
            if (ec) {
                if (ec == asio::error::operation_aborted) return;
                std::cerr << "[WS] accept failed: " << ec.message() << '\n';
            } else {
                auto conn = std::make_shared<WsConnection>(std::move(sock), *this);
                conns_.erase(std::remove_if(conns_.begin(), conns_.end(),
                                            [](const auto& w) { return w.expired(); }),
                             conns_.end());
                conns_.push_back(conn);
                conn->start();
            }
            start_accept();
        });
}

/* ─────────────────────────────────────────────────────────── */

void WsServer::deliver(const std::string& client_id, const std::string& text)
{
    auto it = clients_.find(client_id);
    if (it == clients_.end()) return;
    if (auto c = it->second.lock())
        c->send_text(text);
}

void WsServer::send(const std::string& client_id, const core::Outbound& msg)
{
    asio::post(io_, [this, client_id, text = core::to_compact(msg.to_json())] {
        deliver(client_id, text);
    });
}

void WsServer::reply(const session::SessionPtr& origin, const core::Outbound& msg)
{
    // sessions close on this thread before their id can be registered again
    asio::post(io_, [this, origin, text = core::to_compact(msg.to_json())] {
        if (origin->closed) return;
        deliver(origin->id, text);
    });
}

void WsServer::broadcast(const std::string& text, const std::string& exclude)
{
    asio::post(io_, [this, text, exclude] {
        for (auto& [id, weak] : clients_) {
            if (id == exclude) continue;
            if (auto c = weak.lock())
                c->send_text(text);
        }
    });
}

bool WsServer::register_client(const std::string& id, const std::shared_ptr<WsConnection>& c)
{
    auto [it, inserted] = clients_.try_emplace(id, c);
    if (!inserted && it->second.expired()) {
        it->second = c;
        inserted = true;
    }
    return inserted;
}

void WsServer::unregister_client(const std::string& id, const WsConnection* c)
{
    auto it = clients_.find(id);
    if (it == clients_.end()) return;
    auto live = it->second.lock();
    if (!live || live.get() == c)
        clients_.erase(it);
    if (stopping_ && clients_.empty())
        drain_timer_.cancel();
}

bool WsServer::is_live(const std::string& id) const
{
    auto it = clients_.find(id);
    return it != clients_.end() && !it->second.expired();
}

} // namespace fchat::net
