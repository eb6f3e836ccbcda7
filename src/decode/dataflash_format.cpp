#include "decode/dataflash_format.hpp"

#include <cstring>
#include <sstream>

namespace fchat::decode {

namespace {

/* little-endian readers ───────────────────────────────────── */

template<typename U>
U read_le(const uint8_t* p) noexcept
{
    U v = 0;
    for (std::size_t i = 0; i < sizeof(U); ++i)
        v |= static_cast<U>(p[i]) << (8 * i);
    return v;
}

int16_t  rd_i16(const uint8_t* p) noexcept { return static_cast<int16_t>(read_le<uint16_t>(p)); }
uint16_t rd_u16(const uint8_t* p) noexcept { return read_le<uint16_t>(p); }
int32_t  rd_i32(const uint8_t* p) noexcept { return static_cast<int32_t>(read_le<uint32_t>(p)); }
uint32_t rd_u32(const uint8_t* p) noexcept { return read_le<uint32_t>(p); }
int64_t  rd_i64(const uint8_t* p) noexcept { return static_cast<int64_t>(read_le<uint64_t>(p)); }
uint64_t rd_u64(const uint8_t* p) noexcept { return read_le<uint64_t>(p); }

float rd_f32(const uint8_t* p) noexcept
{
    const uint32_t bits = rd_u32(p);
    float f;
    std::memcpy(&f, &bits, sizeof f);
    return f;
}

double rd_f64(const uint8_t* p) noexcept
{
    const uint64_t bits = rd_u64(p);
    double d;
    std::memcpy(&d, &bits, sizeof d);
    return d;
}

/** char[n] up to the first NUL */
std::string rd_str(const uint8_t* p, std::size_t n)
{
    std::size_t len = 0;
    while (len < n && p[len] != 0) ++len;
    return std::string(reinterpret_cast<const char*>(p), len);
}

std::vector<std::string> split_labels(const std::string& s)
{
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, ','))
        out.push_back(cur);
    return out;
}

} // namespace

std::optional<std::size_t> format_char_size(char c) noexcept
{
    switch (c) {
    case 'b': case 'B': case 'M':           return 1;
    case 'h': case 'H': case 'c': case 'C': return 2;
    case 'i': case 'I': case 'e': case 'E':
    case 'L': case 'f': case 'n':           return 4;
    case 'd': case 'q': case 'Q':           return 8;
    case 'N':                               return 16;
    case 'Z': case 'a':                     return 64;
    default:                                return std::nullopt;
    }
}

std::string MessageFormat::validate() const
{
    std::size_t payload = 0;
    for (char c : format) {
        auto sz = format_char_size(c);
        if (!sz) return std::string("unknown format character '") + c + "'";
        payload += *sz;
    }
    if (labels.size() != format.size())
        return "label count " + std::to_string(labels.size())
             + " does not match format '" + format + "'";
    if (payload + kHeaderSize != length)
        return "length " + std::to_string(length) + " does not match format '"
             + format + "' (" + std::to_string(payload + kHeaderSize) + ")";
    return {};
}

core::Record MessageFormat::decode(const uint8_t* p) const
{
    core::Record r;
    for (std::size_t i = 0; i < format.size(); ++i) {
        const char c = format[i];
        core::FieldValue v;

        switch (c) {
        case 'b': v = int64_t{static_cast<int8_t>(*p)};  break;
        case 'B': v = int64_t{*p};                       break;
        case 'M': v = int64_t{*p};                       break;
        case 'h': v = int64_t{rd_i16(p)};                break;
        case 'H': v = int64_t{rd_u16(p)};                break;
        case 'i': v = int64_t{rd_i32(p)};                break;
        case 'I': v = int64_t{rd_u32(p)};                break;
        case 'q': v = rd_i64(p);                         break;
        case 'Q': v = rd_u64(p);                         break;
        case 'f': v = static_cast<double>(rd_f32(p));    break;
        case 'd': v = rd_f64(p);                         break;
        case 'c': v = rd_i16(p) / 100.0;                 break;
        case 'C': v = rd_u16(p) / 100.0;                 break;
        case 'e': v = rd_i32(p) / 100.0;                 break;
        case 'E': v = rd_u32(p) / 100.0;                 break;
        case 'L': v = rd_i32(p) * 1.0e-7;                break;
        case 'n': v = rd_str(p, 4);                      break;
        case 'N': v = rd_str(p, 16);                     break;
        case 'Z': v = rd_str(p, 64);                     break;
        case 'a': {
            std::ostringstream oss;
            oss << '[';
            for (int k = 0; k < 32; ++k)
                oss << (k ? ", " : "") << rd_i16(p + 2 * k);
            oss << ']';
            v = oss.str();
            break;
        }
        }

        r.set(labels[i], std::move(v));
        p += *format_char_size(c);
    }
    return r;
}

MessageFormat parse_fmt(const uint8_t* payload)
{
    MessageFormat f;
    f.id     = payload[0];
    f.length = payload[1];
    f.name   = rd_str(payload + 2, 4);
    f.format = rd_str(payload + 6, 16);
    f.labels = split_labels(rd_str(payload + 22, 64));
    return f;
}

} // namespace fchat::decode
