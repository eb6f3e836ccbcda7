#include "db/vector_index.hpp"
#include "core/errors.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace fchat::db {

std::string to_vector_literal(const std::vector<float>& v)
{
    std::ostringstream oss;
    oss.precision(9);
    oss << '[';
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) oss << ',';
        oss << v[i];
    }
    oss << ']';
    return oss.str();
}

void check_identifier(const std::string& name)
{
    bool ok = !name.empty() && !std::isdigit(static_cast<unsigned char>(name[0]));
    for (char c : name)
        ok = ok && (std::isalnum(static_cast<unsigned char>(c)) || c == '_');
    if (!ok)
        throw std::invalid_argument("invalid SQL identifier: " + name);
}

VectorIndex::VectorIndex(DbPool& pool, std::string table)
    : pool_(pool), table_(std::move(table))
{
    check_identifier(table_);
    sql_ = "SELECT message_name, description, fields::text, embedding <=> $1::vector AS distance "
           "FROM " + table_ + " ORDER BY distance LIMIT $2";
}

std::vector<llm::RetrievalMatch> VectorIndex::nearest(const std::vector<float>& embedding,
                                                      std::size_t k)
{
    const std::string vec   = to_vector_literal(embedding);
    const std::string limit = std::to_string(k);
    const char* params[2]   = {vec.c_str(), limit.c_str()};

    auto conn = pool_.acquire();
    auto res  = make_result(PQexecParams(*conn, sql_.c_str(), 2, nullptr,
                                         params, nullptr, nullptr, 0));

    if (PQresultStatus(res.get()) != PGRES_TUPLES_OK)
        throw CollaboratorFailure(std::string("vector search failed: ")
                                  + PQresultErrorMessage(res.get()));

    std::vector<llm::RetrievalMatch> out;
    const int rows = PQntuples(res.get());
    out.reserve(static_cast<std::size_t>(rows));

    for (int r = 0; r < rows; ++r) {
        llm::RetrievalMatch m;
        // NULL columns are left out; the pipeline drops such matches
        if (!PQgetisnull(res.get(), r, 0)) m.metadata["MessageName"] = PQgetvalue(res.get(), r, 0);
        if (!PQgetisnull(res.get(), r, 1)) m.metadata["Description"] = PQgetvalue(res.get(), r, 1);
        if (!PQgetisnull(res.get(), r, 2)) m.metadata["Fields"]      = PQgetvalue(res.get(), r, 2);
        m.distance = std::strtod(PQgetvalue(res.get(), r, 3), nullptr);
        out.push_back(std::move(m));
    }
    return out;
}

} // namespace fchat::db
