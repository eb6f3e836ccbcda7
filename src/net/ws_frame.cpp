#include "net/ws_frame.hpp"

#include <utility>

namespace fchat::net {

namespace {

bool is_control(uint8_t op) noexcept { return (op & 0x8) != 0; }

bool known_opcode(uint8_t op) noexcept
{
    switch (op) {
    case 0x0: case 0x1: case 0x2: case 0x8: case 0x9: case 0xA:
        return true;
    default:
        return false;
    }
}

} // namespace

void FrameReader::feed(const uint8_t* data, std::size_t len)
{
    if (pos_ > 0) {
        buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(pos_));
        pos_ = 0;
    }
    buf_.insert(buf_.end(), data, data + len);
}

std::optional<WsMessage> FrameReader::next()
{
    for (;;) {
        const uint8_t* p     = buf_.data() + pos_;
        const std::size_t av = buf_.size() - pos_;
        if (av < 2) return std::nullopt;

        const bool    fin    = (p[0] & 0x80) != 0;
        const uint8_t rsv    = p[0] & 0x70;
        const uint8_t op     = p[0] & 0x0F;
        const bool    masked = (p[1] & 0x80) != 0;
        uint64_t      plen   = p[1] & 0x7F;

        if (rsv)                 throw FrameError(close_code::ProtocolError, "reserved bits set");
        if (!known_opcode(op))   throw FrameError(close_code::ProtocolError, "unknown opcode");
        if (!masked)             throw FrameError(close_code::ProtocolError, "client frame not masked");

        std::size_t hdr = 2;
        if (plen == 126) {
            if (av < 4) return std::nullopt;
            plen = (uint64_t(p[2]) << 8) | p[3];
            hdr = 4;
        } else if (plen == 127) {
            if (av < 10) return std::nullopt;
            plen = 0;
            for (int i = 0; i < 8; ++i) plen = (plen << 8) | p[2 + i];
            hdr = 10;
        }

        if (is_control(op) && (!fin || plen > 125))
            throw FrameError(close_code::ProtocolError, "bad control frame");
        if (plen > max_message_ || (!is_control(op) && frag_.size() + plen > max_message_))
            throw FrameError(close_code::TooBig, "message too big");

        if (av < hdr + 4 + plen) return std::nullopt;

        const uint8_t* key  = p + hdr;
        const uint8_t* body = key + 4;
        std::string payload(static_cast<std::size_t>(plen), '\0');
        for (std::size_t i = 0; i < plen; ++i)
            payload[i] = static_cast<char>(body[i] ^ key[i & 3]);
        pos_ += hdr + 4 + static_cast<std::size_t>(plen);

        if (is_control(op))
            return WsMessage{static_cast<Opcode>(op), std::move(payload)};

        if (op == 0x0) {
            if (!in_fragment_)
                throw FrameError(close_code::ProtocolError, "continuation without a start frame");
            frag_ += payload;
            if (!fin) continue;
            in_fragment_ = false;
            return WsMessage{frag_opcode_, std::exchange(frag_, std::string{})};
        }

        if (in_fragment_)
            throw FrameError(close_code::ProtocolError, "new message inside a fragmented one");
        if (fin)
            return WsMessage{static_cast<Opcode>(op), std::move(payload)};

        in_fragment_ = true;
        frag_opcode_ = static_cast<Opcode>(op);
        frag_        = std::move(payload);
    }
}

/* ------------------------------------------------------------------ */

std::vector<uint8_t> encode_frame(Opcode op, std::string_view payload,
                                  std::optional<std::array<uint8_t, 4>> mask)
{
    std::vector<uint8_t> out;
    const uint64_t n = payload.size();
    out.reserve(14 + payload.size());

    out.push_back(static_cast<uint8_t>(0x80 | static_cast<uint8_t>(op)));
    const uint8_t mbit = mask ? 0x80 : 0x00;
    if (n < 126) {
        out.push_back(static_cast<uint8_t>(mbit | n));
    } else if (n <= 0xFFFF) {
        out.push_back(mbit | 126);
        out.push_back(static_cast<uint8_t>(n >> 8));
        out.push_back(static_cast<uint8_t>(n));
    } else {
        out.push_back(mbit | 127);
        for (int i = 7; i >= 0; --i)
            out.push_back(static_cast<uint8_t>(n >> (8 * i)));
    }

    if (mask) {
        out.insert(out.end(), mask->begin(), mask->end());
        for (std::size_t i = 0; i < payload.size(); ++i)
            out.push_back(static_cast<uint8_t>(payload[i]) ^ (*mask)[i & 3]);
    } else {
        out.insert(out.end(), payload.begin(), payload.end());
    }
    return out;
}

std::vector<uint8_t> encode_close(uint16_t code, std::string_view reason)
{
    std::string body;
    body.push_back(static_cast<char>(code >> 8));
    body.push_back(static_cast<char>(code & 0xFF));
    body.append(reason.substr(0, 123));
    return encode_frame(Opcode::Close, body);
}

uint16_t parse_close_code(std::string_view payload) noexcept
{
    if (payload.size() < 2) return 1005;
    return static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8)
                                 | static_cast<uint8_t>(payload[1]));
}

} // namespace fchat::net
