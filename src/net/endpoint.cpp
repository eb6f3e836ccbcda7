#include "net/endpoint.hpp"
#include "core/errors.hpp"
#include "core/json_util.hpp"

#include <iostream>
#include <variant>

namespace fchat::net {

using core::OutKind;

Endpoint::Endpoint(Outbox& out, session::SessionManager& sessions, util::SessionExecutor& exec)
    : out_(out), sessions_(sessions), exec_(exec)
{}

void Endpoint::send(const std::string& id, OutKind kind, std::string text)
{
    out_.send(id, core::make_outbound(kind, std::move(text)));
}

void Endpoint::reply(const session::SessionPtr& s, OutKind kind, std::string text)
{
    if (s->closed) return;
    out_.reply(s, core::make_outbound(kind, std::move(text)));
}

void Endpoint::submit(const std::string& id, util::SessionExecutor::Job job)
{
    if (!exec_.submit(id, std::move(job)))
        send(id, OutKind::Error, "Session is busy, please retry.");
}

/* ------------------------------------------------------------------ */

void Endpoint::on_open(const std::string& id)
{
    sessions_.open(id);
    std::cout << "[WS] client " << id << " connected\n";
    send(id, OutKind::System, "Welcome! Your client ID is: " + id);
}

void Endpoint::on_close(const std::string& id)
{
    exec_.cancel(id);
    sessions_.close(id);
    std::cout << "[WS] client " << id << " disconnected\n";

    const auto bye = core::make_outbound(OutKind::System, "Client " + id + " disconnected");
    out_.broadcast(core::to_compact(bye.to_json()), id);
}

void Endpoint::on_message(const std::string& id, std::string_view text)
{
    try {
        auto in = core::parse_envelope(text);
        std::visit([&](auto& body) { handle(id, body); }, in.body);
    }
    catch (const MalformedEnvelope& e) {
        std::cerr << "[WS] " << id << ": " << e.what() << '\n';
        send(id, OutKind::Error, e.what());
    }
    catch (const std::exception& e) {
        std::cerr << "[WS] error processing message from " << id << ": " << e.what() << '\n';
        send(id, OutKind::Error, e.what());
    }
}

/* ------------------------------------------------------------------ */

void Endpoint::handle(const std::string& id, core::FileChunk& m)
{
    const auto ack = sessions_.receive_chunk(id, m.index, std::move(m.bytes),
                                             m.file_name, m.total);
    send(id, OutKind::Acknowledgment,
         "Received chunk " + std::to_string(ack.index + 1) + "/" + std::to_string(ack.total));
}

void Endpoint::handle(const std::string& id, core::FileComplete& m)
{
    std::cout << "[WS] " << id << " transfer complete for " << m.file_name
              << " (" << m.total << " chunks)\n";

    // Only the network thread submits, so room seen here is still there at
    // submit(). Checked first so a busy lane leaves the chunks buffered.
    if (!exec_.has_room(id)) {
        send(id, OutKind::Error, "Session is busy, please retry.");
        return;
    }
    send(id, OutKind::System, "Processing File");

    session::PendingUpload up;
    try {
        up = sessions_.take_upload(sessions_.acquire(id), m.file_name, m.total);
    }
    catch (const Error& e) {
        send(id, OutKind::Error, std::string("Failed to save file: ") + e.what());
        return;
    }

    auto s       = up.session;
    auto pending = std::make_shared<session::PendingUpload>(std::move(up));
    submit(id, [this, s, pending] {
        session::TransferResult res;
        try {
            res = sessions_.bind_upload(std::move(*pending));
        }
        catch (const std::exception& e) {
            reply(s, OutKind::Error, std::string("Failed to save file: ") + e.what());
            return;
        }

        reply(s, OutKind::System,
              "File saved successfully: " + res.saved.filename().string());
        if (res.processed)
            reply(s, OutKind::System,
                  "Log file processed successfully: " + res.processed->filename().string());
        else
            reply(s, OutKind::Error, "Failed to process log file");
    });
}

void Endpoint::handle(const std::string& id, core::ChatMessage& m)
{
    auto s = sessions_.acquire(id);
    submit(id, [this, id, s, query = std::move(m.text)] {
        try {
            const auto answer = sessions_.run_turn(s, query, [&] {
                reply(s, OutKind::Chat, "Processing your question...");
            });
            reply(s, OutKind::Chat, answer);
        }
        catch (const NoPipelineBound& e) {
            reply(s, OutKind::Error, e.what());
        }
        catch (const std::exception& e) {
            std::cerr << "[PIPELINE] turn failed for " << id << ": " << e.what() << '\n';
            reply(s, OutKind::Error,
                  std::string("I encountered an error while processing your message: ") + e.what());
        }
    });
}

void Endpoint::handle(const std::string& id, core::Passthrough& m)
{
    auto ack = core::make_outbound(OutKind::Acknowledgment, "Message received");
    ack.original_message = m.message;
    out_.send(id, ack);
    out_.broadcast(core::to_compact(m.message), id);
}

} // namespace fchat::net
