#include <csignal>
#include <iostream>
#include <stdexcept>

#include <asio.hpp>

#include "core/schema.hpp"
#include "db/db_pool.hpp"
#include "db/vector_index.hpp"
#include "decode/log_decoder.hpp"
#include "llm/anthropic_client.hpp"
#include "llm/embedding_client.hpp"
#include "llm/http_client.hpp"
#include "llm/vector_retriever.hpp"
#include "net/endpoint.hpp"
#include "net/ws_server.hpp"
#include "session/session_manager.hpp"
#include "util/config.hpp"
#include "util/session_executor.hpp"
#include "util/thread_pool.hpp"

int main() {
    using namespace fchat;
    try {
        std::cout.setf(std::ios::unitbuf); // flush stdout after each output
        std::cerr.setf(std::ios::unitbuf); // flush stderr after each output
        std::cout << "[MAIN] Starting server...\n";

        const auto cfg = util::Config::from_env();
        llm::CurlGlobal curl;

        // Read-only, shared by every session
        const auto catalog = core::SchemaCatalog::load_file(cfg.schema_file);

        db::DbPool                pool(cfg.pg_conninfo, cfg.pg_pool);
        db::VectorIndex           index(pool, cfg.index_table);
        llm::EmbeddingClient      embedder(cfg.embedding_url, cfg.embedding_model,
                                           cfg.embedding_key, cfg.http_timeout_ms);
        llm::VectorRetriever      retriever(embedder, index);
        llm::AnthropicClient      completion(cfg.anthropic_url, cfg.anthropic_key,
                                             cfg.http_timeout_ms);
        decode::DataflashDecoder  decoder;

        pipeline::PipelineOptions popts;
        popts.analyze.model = cfg.analyze_model;
        popts.answer.model  = cfg.answer_model;

        session::SessionManager sessions(catalog, retriever, completion, decoder,
                                         {cfg.upload_dir, cfg.processed_dir},
                                         popts, cfg.history_on_failure);

        util::ThreadPool      workers(cfg.workers);
        util::SessionExecutor exec(workers);

        asio::io_context io;
        net::WsServer    server(io, cfg.host, cfg.port, cfg.max_message_bytes);
        net::Endpoint    endpoint(server, sessions, exec);
        server.start(endpoint);

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](std::error_code ec, int sig) {
            if (ec) return;
            std::cout << "[MAIN] signal " << sig << ", shutting down\n";
            // run() returns once the close frames are out
            server.stop();
        });

        std::cout << "[MAIN] Server is running on " << cfg.host << ':' << cfg.port
                  << " with " << workers.size() << " workers\n";
        io.run();

        // jobs still running reference the endpoint; drain them first
        exec.wait_idle();
        std::cout << "[MAIN] Bye\n";
    }
    catch (const std::exception& e) {
        std::cerr << "[Fatal] " << e.what() << '\n';
        return 1;
    }
}
