#pragma once
#include <memory>
#include <string>
#include <string_view>

#include "core/envelope.hpp"
#include "session/session_manager.hpp"
#include "util/session_executor.hpp"

namespace fchat::net
{

/** Where the endpoint writes; implemented by WsServer (and fakes in tests). */
class Outbox
{
public:
    virtual ~Outbox() = default;

    /** Queues `msg` to one connection; dropped silently if it is gone. */
    virtual void send(const std::string& client_id, const core::Outbound& msg) = 0;

    /**
     *  Queues `msg` to `origin`'s connection unless that session has been
     *  closed by the time it is delivered; a newer connection reusing the
     *  id never sees it.
     */
    virtual void reply(const session::SessionPtr& origin, const core::Outbound& msg) = 0;

    /** Queues raw JSON text to every connection except `exclude`. */
    virtual void broadcast(const std::string& text, const std::string& exclude) = 0;
};

/**
 *  Dispatches decoded envelopes to the session manager.
 *
 *  Called on the network thread. Chunk buffering is cheap and done
 *  inline so acknowledgments follow receipt order; decoding and chat
 *  turns go to the session's executor lane.
 */
class Endpoint
{
public:
    Endpoint(Outbox& out, session::SessionManager& sessions, util::SessionExecutor& exec);

    void on_open(const std::string& client_id);
    void on_message(const std::string& client_id, std::string_view text);
    void on_close(const std::string& client_id);

private:
    void handle(const std::string& id, core::FileChunk& m);
    void handle(const std::string& id, core::FileComplete& m);
    void handle(const std::string& id, core::ChatMessage& m);
    void handle(const std::string& id, core::Passthrough& m);

    void send(const std::string& id, core::OutKind kind, std::string text);
    void reply(const session::SessionPtr& s, core::OutKind kind, std::string text);
    void submit(const std::string& id, util::SessionExecutor::Job job);

    Outbox&                  out_;
    session::SessionManager& sessions_;
    util::SessionExecutor&   exec_;
};

} // namespace fchat::net
