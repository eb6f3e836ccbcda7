#pragma once
/**
 *  ArduPilot DataFlash (.bin) framing.
 *
 *  ┌──────┬──────┬────────┬──────────────────────────────┐
 *  │ 0xA3 │ 0x95 │ msg id │ payload (FMT[msg id].length-3)│
 *  └──────┴──────┴────────┴──────────────────────────────┘
 *
 *  FMT (id 128) describes every other message:
 *      type u8 | length u8 | name char[4] | format char[16] | labels char[64]
 *  `length` counts the 3 header bytes.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/value.hpp"

namespace fchat::decode
{

constexpr uint8_t     kHead1      = 0xA3;
constexpr uint8_t     kHead2      = 0x95;
constexpr uint8_t     kFmtId      = 128;
constexpr std::size_t kHeaderSize = 3;
constexpr std::size_t kFmtLength  = 89;

/** Payload bytes of one format character, nullopt if unknown. */
std::optional<std::size_t> format_char_size(char c) noexcept;

struct MessageFormat
{
    uint8_t                  id = 0;
    std::size_t              length = 0;    ///< header included
    std::string              name;
    std::string              format;
    std::vector<std::string> labels;

    /**
     *  Empty when the format is usable; otherwise why it isn't
     *  (unknown character, label count or length mismatch).
     */
    std::string validate() const;

    /** Decodes `length - 3` payload bytes; format must be valid. */
    core::Record decode(const uint8_t* payload) const;
};

/** Parses the 86-byte FMT payload. */
MessageFormat parse_fmt(const uint8_t* payload);

} // namespace fchat::decode
