#include <gtest/gtest.h>

#include "net/ws_frame.hpp"

using namespace fchat::net;

namespace {

constexpr std::array<uint8_t, 4> kMask{0x37, 0xfa, 0x21, 0x3d};

std::vector<uint8_t> masked(Opcode op, std::string_view payload)
{
    return encode_frame(op, payload, kMask);
}

/** masked frame with FIN cleared */
std::vector<uint8_t> partial(Opcode op, std::string_view payload)
{
    auto f = masked(op, payload);
    f[0] &= 0x7F;
    return f;
}

void feed(FrameReader& r, const std::vector<uint8_t>& bytes)
{
    r.feed(bytes.data(), bytes.size());
}

} // namespace

TEST(FrameReader, DecodesRfcMaskedHello)
{
    // RFC 6455 5.7: single-frame masked text "Hello"
    const std::vector<uint8_t> wire{0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d,
                                    0x7f, 0x9f, 0x4d, 0x51, 0x58};
    EXPECT_EQ(masked(Opcode::Text, "Hello"), wire);

    FrameReader r(1024);
    feed(r, wire);
    const auto m = r.next();
    ASSERT_TRUE(m);
    EXPECT_EQ(m->opcode, Opcode::Text);
    EXPECT_EQ(m->payload, "Hello");
    EXPECT_FALSE(r.next());
    EXPECT_EQ(r.buffered(), 0u);
}

TEST(FrameReader, WaitsForBytesSplitAcrossReads)
{
    const std::string text(300, 'x');
    const auto wire = masked(Opcode::Text, text);

    FrameReader r(1024);
    for (std::size_t i = 0; i + 1 < wire.size(); ++i) {
        r.feed(&wire[i], 1);
        EXPECT_FALSE(r.next()) << "at byte " << i;
    }
    r.feed(&wire.back(), 1);
    const auto m = r.next();
    ASSERT_TRUE(m);
    EXPECT_EQ(m->payload, text);
}

TEST(FrameReader, JoinsFragmentsAroundInterleavedPing)
{
    FrameReader r(1024);
    feed(r, partial(Opcode::Text, "{\"type\":"));
    feed(r, masked(Opcode::Ping, "hb"));
    feed(r, partial(Opcode::Continuation, "\"chat\","));
    feed(r, masked(Opcode::Continuation, "\"content\":\"hi\"}"));

    const auto ping = r.next();
    ASSERT_TRUE(ping);
    EXPECT_EQ(ping->opcode, Opcode::Ping);
    EXPECT_EQ(ping->payload, "hb");

    const auto m = r.next();
    ASSERT_TRUE(m);
    EXPECT_EQ(m->opcode, Opcode::Text);
    EXPECT_EQ(m->payload, R"({"type":"chat","content":"hi"})");
    EXPECT_FALSE(r.next());
}

TEST(FrameReader, SeveralFramesInOneRead)
{
    auto wire = masked(Opcode::Text, "one");
    const auto second = masked(Opcode::Text, "two");
    wire.insert(wire.end(), second.begin(), second.end());

    FrameReader r(64);
    feed(r, wire);
    EXPECT_EQ(r.next()->payload, "one");
    EXPECT_EQ(r.next()->payload, "two");
    EXPECT_FALSE(r.next());
}

TEST(FrameReader, ProtocolViolations)
{
    auto expect_code = [](const std::vector<uint8_t>& wire, uint16_t code) {
        FrameReader r(1024);
        feed(r, wire);
        try {
            r.next();
            ADD_FAILURE() << "expected FrameError";
        } catch (const FrameError& e) {
            EXPECT_EQ(e.code(), code) << e.what();
        }
    };

    expect_code(encode_frame(Opcode::Text, "plain"), close_code::ProtocolError);

    auto rsv = masked(Opcode::Text, "x");
    rsv[0] |= 0x40;
    expect_code(rsv, close_code::ProtocolError);

    auto unknown = masked(Opcode::Text, "x");
    unknown[0] = static_cast<uint8_t>((unknown[0] & 0xF0) | 0x3);
    expect_code(unknown, close_code::ProtocolError);

    expect_code(partial(Opcode::Ping, "x"), close_code::ProtocolError);
    expect_code(masked(Opcode::Ping, std::string(126, 'p')), close_code::ProtocolError);
    expect_code(masked(Opcode::Continuation, "stray"), close_code::ProtocolError);

    auto nested = partial(Opcode::Text, "a");
    const auto again = masked(Opcode::Text, "b");
    nested.insert(nested.end(), again.begin(), again.end());
    expect_code(nested, close_code::ProtocolError);
}

TEST(FrameReader, RejectsOversizedMessages)
{
    {
        FrameReader r(100);
        feed(r, masked(Opcode::Text, std::string(101, 'x')));
        try {
            r.next();
            FAIL() << "expected FrameError";
        } catch (const FrameError& e) {
            EXPECT_EQ(e.code(), close_code::TooBig);
        }
    }
    {
        // each fragment fits, the joined message does not
        FrameReader r(100);
        feed(r, partial(Opcode::Text, std::string(60, 'x')));
        feed(r, masked(Opcode::Continuation, std::string(60, 'y')));
        EXPECT_THROW(r.next(), FrameError);
    }
    {
        // refused from the header alone
        FrameReader r(100);
        const std::vector<uint8_t> hdr{0x81, 0xFF, 0, 0, 0, 1, 0, 0, 0, 0};
        feed(r, hdr);
        EXPECT_THROW(r.next(), FrameError);
    }
}

TEST(EncodeFrame, LengthEncodings)
{
    const auto small = encode_frame(Opcode::Text, std::string(125, 'a'));
    EXPECT_EQ(small[1], 125);
    EXPECT_EQ(small.size(), 2u + 125);

    const auto mid = encode_frame(Opcode::Text, std::string(126, 'a'));
    EXPECT_EQ(mid[1], 126);
    EXPECT_EQ(mid[2], 0);
    EXPECT_EQ(mid[3], 126);
    EXPECT_EQ(mid.size(), 4u + 126);

    const auto big = encode_frame(Opcode::Binary, std::string(70000, 'a'));
    EXPECT_EQ(big[0], 0x82);
    EXPECT_EQ(big[1], 127);
    EXPECT_EQ(big[7], 0x01);
    EXPECT_EQ(big[8], 0x11);
    EXPECT_EQ(big[9], 0x70);
    EXPECT_EQ(big.size(), 10u + 70000);
}

TEST(EncodeFrame, CloseCarriesCode)
{
    const auto f = encode_close(close_code::TooBig, "too big");
    EXPECT_EQ(f[0], 0x88);
    EXPECT_EQ(f[1], 2 + 7);

    const std::string payload(f.begin() + 2, f.end());
    EXPECT_EQ(parse_close_code(payload), 1009);
    EXPECT_EQ(payload.substr(2), "too big");

    EXPECT_EQ(parse_close_code(""), 1005);
}
