#pragma once
#include <cstdint>
#include <filesystem>
#include <vector>

#include "core/record_set.hpp"

namespace fchat::decode
{

/**
 *  Turns a reconstructed log file into a DecodedRecordSet.
 *
 *  Implementations skip (and log) message types they cannot decode and
 *  throw fchat::DecodeFailure only when the file as a whole is unusable.
 */
class LogDecoder
{
public:
    virtual ~LogDecoder() = default;
    virtual core::DecodedRecordSet decode(const std::filesystem::path& file) = 0;
};

class DataflashDecoder : public LogDecoder
{
public:
    core::DecodedRecordSet decode(const std::filesystem::path& file) override;

    /** Same as decode() on an in-memory image (gzip accepted). */
    core::DecodedRecordSet decode_bytes(std::vector<uint8_t> bytes) const;
};

/** True when the buffer starts with the gzip magic (1f 8b). */
bool is_gzip(const std::vector<uint8_t>& bytes) noexcept;

/** Inflates a gzip stream; throws fchat::DecodeFailure on corrupt input. */
std::vector<uint8_t> gunzip(const std::vector<uint8_t>& bytes);

} // namespace fchat::decode
