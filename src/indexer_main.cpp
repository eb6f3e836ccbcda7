#include <iostream>
#include <memory>
#include <stdexcept>

#include <libpq-fe.h>

#include "core/schema.hpp"
#include "db/schema_index_writer.hpp"
#include "llm/embedding_client.hpp"
#include "llm/http_client.hpp"
#include "util/config.hpp"

// flightchat_indexer [schema.json]
//   embeds every schema entry and upserts it into the vector index table
int main(int argc, char** argv) {
    using namespace fchat;
    try {
        std::cout.setf(std::ios::unitbuf);
        std::cerr.setf(std::ios::unitbuf);

        const auto cfg = util::Config::from_env(/*require_completion=*/false);
        const std::string schema_path = argc > 1 ? argv[1] : cfg.schema_file;

        const auto catalog = core::SchemaCatalog::load_file(schema_path);
        if (catalog.size() == 0)
            throw std::runtime_error("no schema entries in " + schema_path);
        std::cout << "[INDEX] Prepared " << catalog.size() << " documents for embedding\n";

        llm::CurlGlobal      curl;
        llm::EmbeddingClient embedder(cfg.embedding_url, cfg.embedding_model,
                                      cfg.embedding_key, cfg.http_timeout_ms);

        std::unique_ptr<PGconn, void(*)(PGconn*)> conn(PQconnectdb(cfg.pg_conninfo.c_str()), PQfinish);
        if (!conn || PQstatus(conn.get()) != CONNECTION_OK)
            throw std::runtime_error(std::string("[DB] connection failed: ")
                                     + PQerrorMessage(conn.get()));

        db::SchemaIndexWriter writer(conn.get(), cfg.index_table);

        const auto& entries = catalog.entries();
        for (std::size_t i = 0; i < entries.size(); ++i) {
            auto emb = embedder.embed(db::index_document(entries[i]));
            if (i == 0)
                writer.ensure_table(emb.size());
            writer.push(db::make_index_row(i, entries[i], std::move(emb)));
        }
        writer.flush();

        std::cout << "[INDEX] Stored " << writer.written() << " documents in '"
                  << cfg.index_table << "'\n";
    }
    catch (const std::exception& e) {
        std::cerr << "[Fatal] " << e.what() << '\n';
        return 1;
    }
}
