#include "db/db_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace fchat::db
{

DbPool::DbPool(std::string conninfo, std::size_t size)
{
    if (size == 0)
        throw std::invalid_argument("DbPool: size must be > 0");

    for (std::size_t i = 0; i < size; ++i)
    {
        PGconnPtr conn(PQconnectdb(conninfo.c_str()), PQfinish);
        if (!conn || PQstatus(conn.get()) != CONNECTION_OK)
        {
            const std::string err = conn ? PQerrorMessage(conn.get()) : "out of memory";
            throw std::runtime_error("DbPool: connection failed: " + err);
        }
        conns_.push_back(std::move(conn));
        busy_.push_back(false);
    }
    std::cout << "[DB] Pool ready with " << size << " connections\n";
}

DbPool::Guard DbPool::acquire()
{
    std::unique_lock lock(m_);
    cv_.wait(lock, [&] {
        for (bool b : busy_) if (!b) return true;
        return false;
    });

    for (std::size_t i = 0; i < conns_.size(); ++i)
    {
        if (!busy_[i])
        {
            busy_[i] = true;
            PGconn* c = conns_[i].get();
            if (PQstatus(c) == CONNECTION_BAD)
            {
                std::cerr << "[DB] resetting connection …\n";
                PQreset(c);
                if (PQstatus(c) != CONNECTION_OK)
                    std::cerr << "[DB] reset failed: " << PQerrorMessage(c);
            }
            return Guard(*this, c);
        }
    }

    throw std::runtime_error("DbPool: no available connection after wait");
}

void DbPool::release(PGconn* conn)
{
    std::lock_guard lock(m_);
    for (std::size_t i = 0; i < conns_.size(); ++i)
    {
        if (conns_[i].get() == conn)
        {
            busy_[i] = false;
            cv_.notify_one();
            return;
        }
    }
    std::cerr << "[DB] release of unknown connection ignored\n";
}

} // namespace fchat::db
