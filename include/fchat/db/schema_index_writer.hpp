#pragma once
#include <libpq-fe.h>
#include <cstddef>
#include <string>
#include <vector>

#include "core/schema.hpp"

namespace fchat::db {

struct IndexRow
{
    std::string        id;
    std::string        message_name;
    std::string        description;
    std::string        fields_json;    ///< [{FieldName, Units, Description}]
    std::string        document;
    std::vector<float> embedding;
};

/** Text embedded for one schema entry. */
std::string index_document(const core::SchemaEntry& e);

/** Row for entry number `i` of the schema document. */
IndexRow make_index_row(std::size_t i, const core::SchemaEntry& e, std::vector<float> embedding);

/**
 *  Batched upsert of schema rows into the vector index table.
 *  Rows are sent as one multi-row INSERT … ON CONFLICT per batch.
 */
class SchemaIndexWriter {
public:
    SchemaIndexWriter(PGconn* conn, std::string table, std::size_t batch_size = 64);

    /** Logs (never throws) if rows are still pending. */
    ~SchemaIndexWriter();

    /** CREATE EXTENSION vector / CREATE TABLE if missing. */
    void ensure_table(std::size_t dimension);

    void push(IndexRow row);

    /** Throws std::runtime_error when the INSERT fails. */
    void flush();

    std::size_t written() const noexcept { return written_; }

private:
    void exec(const std::string& sql);

    PGconn*               conn_;
    std::string           table_;
    std::size_t           batch_size_;
    std::vector<IndexRow> rows_;
    std::size_t           written_ = 0;
};

} // namespace fchat::db
