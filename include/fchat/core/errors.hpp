#pragma once
/**
 *  Error taxonomy shared by every layer.
 *
 *  All kinds reach the originating session as an `error` envelope;
 *  none of them is allowed to escape into the asio event loop.
 */
#include <cstddef>
#include <stdexcept>
#include <string>

namespace fchat
{

class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/* ── sessions ───────────────────────────────────────────────── */

class UnknownSession : public Error
{
public:
    explicit UnknownSession(const std::string& id)
        : Error("Unknown session: " + id) {}
};

/* ── upload ─────────────────────────────────────────────────── */

class IncompleteTransfer : public Error
{
public:
    IncompleteTransfer(std::size_t received, std::size_t expected)
        : Error("Missing chunks: expected " + std::to_string(expected)
                + ", got " + std::to_string(received)),
          received_(received), expected_(expected) {}

    std::size_t received() const noexcept { return received_; }
    std::size_t expected() const noexcept { return expected_; }

private:
    std::size_t received_;
    std::size_t expected_;
};

class MissingChunk : public Error
{
public:
    explicit MissingChunk(std::size_t index)
        : Error("Missing chunk " + std::to_string(index)), index_(index) {}

    std::size_t index() const noexcept { return index_; }

private:
    std::size_t index_;
};

class DecodeFailure : public Error
{
public:
    using Error::Error;
};

/* ── chat ───────────────────────────────────────────────────── */

class NoPipelineBound : public Error
{
public:
    NoPipelineBound()
        : Error("Please upload a log file first before asking questions.") {}
};

class CollaboratorFailure : public Error
{
public:
    using Error::Error;
};

/* ── transport ──────────────────────────────────────────────── */

class MalformedEnvelope : public Error
{
public:
    using Error::Error;
};

} // namespace fchat
