#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "net/endpoint.hpp"
#include "net/ws_connection.hpp"

namespace fchat::net
{

/**
 *  TCP acceptor serving GET /health, GET / and the /ws/{client_id}
 *  WebSocket route on one port.
 *
 *  Outbox calls may come from any thread; they are posted onto the
 *  io_context, which must be run by a single thread.
 */
class WsServer : public Outbox
{
public:
    WsServer(asio::io_context& io, const std::string& host, uint16_t port,
             std::size_t max_message_bytes);

    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    /** Starts accepting; `ep` must outlive the server. */
    void start(Endpoint& ep);

    /**
     *  Stops accepting, sends 1001 to every WebSocket client and drops
     *  connections still in the HTTP phase. io_context::run() returns once
     *  the close frames are written, or after kDrainTimeout at the latest.
     */
    void stop();

    static constexpr std::chrono::seconds kDrainTimeout{5};

    void send(const std::string& client_id, const core::Outbound& msg) override;
    void reply(const session::SessionPtr& origin, const core::Outbound& msg) override;
    void broadcast(const std::string& text, const std::string& exclude) override;

    uint16_t port() const;

    /* io thread only ──────────────────────────────────────────── */
    bool register_client(const std::string& id, const std::shared_ptr<WsConnection>& c);
    void unregister_client(const std::string& id, const WsConnection* c);
    bool is_live(const std::string& id) const;
    Endpoint& endpoint() { return *endpoint_; }
    std::size_t max_message_bytes() const noexcept { return max_message_; }

private:
    void start_accept();
    void deliver(const std::string& client_id, const std::string& text);

    asio::io_context&        io_;
    asio::ip::tcp::acceptor  acceptor_;
    Endpoint*                endpoint_ = nullptr;
    std::size_t              max_message_;

    asio::steady_timer       drain_timer_;
    bool                     stopping_ = false;

    std::unordered_map<std::string, std::weak_ptr<WsConnection>> clients_;
    std::vector<std::weak_ptr<WsConnection>>                     conns_;   ///< every accepted socket
};

} // namespace fchat::net
