#include "db/schema_index_writer.hpp"
#include "db/db_pool.hpp"
#include "db/vector_index.hpp"
#include "core/json_util.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fchat::db {

std::string index_document(const core::SchemaEntry& e)
{
    return "Log Message: " + e.name + "\n"
         + "Description: " + e.description + "\n"
         + "Fields:\n" + core::format_fields(e);
}

IndexRow make_index_row(std::size_t i, const core::SchemaEntry& e, std::vector<float> embedding)
{
    Json::Value fields(Json::arrayValue);
    for (const auto& f : e.fields) {
        Json::Value o(Json::objectValue);
        o["FieldName"]   = f.name;
        o["Units"]       = f.units;
        o["Description"] = f.description;
        fields.append(o);
    }

    return IndexRow{
        "log_msg_" + std::to_string(i) + "_" + e.name,
        e.name,
        e.description,
        core::to_compact(fields),
        index_document(e),
        std::move(embedding)};
}

/* ─────────────────────────────────────────────────────────── */

SchemaIndexWriter::SchemaIndexWriter(PGconn* conn, std::string table, std::size_t batch_size)
    : conn_(conn), table_(std::move(table)), batch_size_(batch_size ? batch_size : 1)
{
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK)
        throw std::runtime_error("Invalid PostgreSQL connection");
    check_identifier(table_);
}

SchemaIndexWriter::~SchemaIndexWriter()
{
    if (!rows_.empty())
        std::cerr << "[DB-index] " << rows_.size() << " rows dropped without flush\n";
}

void SchemaIndexWriter::exec(const std::string& sql)
{
    auto res = make_result(PQexec(conn_, sql.c_str()));
    if (PQresultStatus(res.get()) != PGRES_COMMAND_OK)
        throw std::runtime_error(sql.substr(0, 40) + "… failed: "
                                 + PQresultErrorMessage(res.get()));
}

void SchemaIndexWriter::ensure_table(std::size_t dimension)
{
    exec("CREATE EXTENSION IF NOT EXISTS vector");
    exec("CREATE TABLE IF NOT EXISTS " + table_ + " ("
         "id text PRIMARY KEY, "
         "message_name text NOT NULL, "
         "description text NOT NULL, "
         "fields jsonb NOT NULL, "
         "document text NOT NULL, "
         "embedding vector(" + std::to_string(dimension) + ") NOT NULL)");
}

void SchemaIndexWriter::push(IndexRow row)
{
    rows_.push_back(std::move(row));
    if (rows_.size() >= batch_size_) flush();
}

void SchemaIndexWriter::flush()
{
    if (rows_.empty()) return;

    auto t0 = std::chrono::steady_clock::now();

    /* 1) statement: ($1,$2,$3,$4::jsonb,$5,$6::vector), ($7,…) */
    std::ostringstream sql;
    sql << "INSERT INTO " << table_
        << " (id,message_name,description,fields,document,embedding) VALUES ";
    for (std::size_t r = 0; r < rows_.size(); ++r) {
        const std::size_t b = r * 6;
        if (r) sql << ',';
        sql << "($" << b + 1 << ",$" << b + 2 << ",$" << b + 3
            << ",$" << b + 4 << "::jsonb,$" << b + 5 << ",$" << b + 6 << "::vector)";
    }
    sql << " ON CONFLICT (id) DO UPDATE SET "
           "message_name = EXCLUDED.message_name, description = EXCLUDED.description, "
           "fields = EXCLUDED.fields, document = EXCLUDED.document, "
           "embedding = EXCLUDED.embedding";

    /* 2) parameters (kept alive until PQexecParams returns) */
    std::vector<std::string> vectors;
    vectors.reserve(rows_.size());
    std::vector<const char*> params;
    params.reserve(rows_.size() * 6);
    for (const auto& row : rows_) {
        vectors.push_back(to_vector_literal(row.embedding));
        params.push_back(row.id.c_str());
        params.push_back(row.message_name.c_str());
        params.push_back(row.description.c_str());
        params.push_back(row.fields_json.c_str());
        params.push_back(row.document.c_str());
        params.push_back(vectors.back().c_str());
    }

    /* 3) execution */
    const std::string stmt = sql.str();
    auto res = make_result(PQexecParams(conn_, stmt.c_str(), static_cast<int>(params.size()),
                                        nullptr, params.data(), nullptr, nullptr, 0));
    if (PQresultStatus(res.get()) != PGRES_COMMAND_OK)
        throw std::runtime_error(std::string("[DB-index] upsert failed: ")
                                 + PQresultErrorMessage(res.get()));

    written_ += rows_.size();
    auto dt = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::steady_clock::now() - t0).count();
    std::cout << "[DB-index] Upserted " << rows_.size() << " rows in " << dt << " ms\n";
    rows_.clear();
}

} // namespace fchat::db
