#pragma once
/**
 *  pgvector-backed schema index.
 *
 *      CREATE TABLE <table> (
 *          id           text PRIMARY KEY,
 *          message_name text NOT NULL,
 *          description  text NOT NULL,
 *          fields       jsonb NOT NULL,
 *          document     text NOT NULL,
 *          embedding    vector(D) NOT NULL);
 *
 *  Searched by cosine distance (`<=>`).
 */
#include <string>
#include <vector>

#include "db/db_pool.hpp"
#include "llm/services.hpp"

namespace fchat::db
{

/** "[0.1,0.2,...]" literal accepted by `::vector` */
std::string to_vector_literal(const std::vector<float>& v);

/** Rejects anything but [A-Za-z_][A-Za-z0-9_]* so it can be spliced into SQL. */
void check_identifier(const std::string& name);

class VectorIndex
{
public:
    VectorIndex(DbPool& pool, std::string table);

    /** k nearest rows, closest first; throws fchat::CollaboratorFailure */
    std::vector<llm::RetrievalMatch> nearest(const std::vector<float>& embedding,
                                             std::size_t k);

    const std::string& table() const noexcept { return table_; }

private:
    DbPool&     pool_;
    std::string table_;
    std::string sql_;
};

} // namespace fchat::db
