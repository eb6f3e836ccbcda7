#pragma once
/**
 *  RFC 6455 framing, server side.
 *
 *  +-+-+-+-+-------+-+-------------+-------------------------------+
 *  |F|R|R|R| opcode|M| Payload len |    Extended payload length    |
 *  |I|S|S|S|  (4)  |A|     (7)     |            (16/64)            |
 *  +-+-+-+-+-------+-+-------------+ - - - - - - - - - - - - - - - +
 *  |     Masking-key (client → server only)    |   Payload data    |
 *  +-------------------------------------------+-------------------+
 */
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/errors.hpp"

namespace fchat::net
{

enum class Opcode : uint8_t
{
    Continuation = 0x0,
    Text         = 0x1,
    Binary       = 0x2,
    Close        = 0x8,
    Ping         = 0x9,
    Pong         = 0xA
};

namespace close_code
{
constexpr uint16_t Normal        = 1000;
constexpr uint16_t GoingAway     = 1001;
constexpr uint16_t ProtocolError = 1002;
constexpr uint16_t Unsupported   = 1003;
constexpr uint16_t TooBig        = 1009;
constexpr uint16_t Internal      = 1011;
}

/** Peer broke the protocol; the connection closes with `code()`. */
class FrameError : public Error
{
public:
    FrameError(uint16_t code, const std::string& what) : Error(what), code_(code) {}
    uint16_t code() const noexcept { return code_; }

private:
    uint16_t code_;
};

/** A whole message (continuations joined) or a control frame. */
struct WsMessage
{
    Opcode      opcode;
    std::string payload;
};

/**
 *  Incremental reader for client frames: feed() raw socket bytes, then
 *  call next() until it returns nothing. Throws FrameError on unmasked
 *  frames, bad control frames, stray continuations, reserved bits, or a
 *  message larger than `max_message`.
 */
class FrameReader
{
public:
    explicit FrameReader(std::size_t max_message) : max_message_(max_message) {}

    void feed(const uint8_t* data, std::size_t len);
    std::optional<WsMessage> next();

    std::size_t buffered() const noexcept { return buf_.size() - pos_; }

private:
    std::vector<uint8_t> buf_;
    std::size_t          pos_ = 0;
    std::size_t          max_message_;

    bool        in_fragment_ = false;
    Opcode      frag_opcode_ = Opcode::Text;
    std::string frag_;
};

/** One FIN frame; masked only when `mask` is given (client side / tests). */
std::vector<uint8_t> encode_frame(Opcode op, std::string_view payload,
                                  std::optional<std::array<uint8_t, 4>> mask = std::nullopt);

/** Close frame carrying a status code and optional reason. */
std::vector<uint8_t> encode_close(uint16_t code, std::string_view reason = {});

/** Status code of a close payload; 1005 (no status) when absent. */
uint16_t parse_close_code(std::string_view payload) noexcept;

} // namespace fchat::net
