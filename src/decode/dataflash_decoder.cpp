#include "decode/log_decoder.hpp"
#include "decode/dataflash_format.hpp"
#include "core/errors.hpp"

#include <array>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include <zlib.h>

namespace fchat::decode {

namespace {

// GPS epoch (1980-01-06) in unix seconds, and the GPS-UTC leap offset
constexpr int64_t kGpsEpochUnix  = 315964800;
constexpr int64_t kGpsLeapSecs   = 18;
constexpr int64_t kSecondsInWeek = 7 * 24 * 3600;

std::optional<int64_t> as_int(const core::FieldValue* v)
{
    if (!v) return std::nullopt;
    if (auto i = std::get_if<int64_t>(v))  return *i;
    if (auto u = std::get_if<uint64_t>(v)) return static_cast<int64_t>(*u);
    return std::nullopt;
}

/** UTC(µs) - TimeUS, from the first GPS fix carrying a week number */
std::optional<int64_t> gps_utc_offset(const core::Record& gps)
{
    const auto week = as_int(gps.find("GWk"));
    const auto ms   = as_int(gps.find("GMS"));
    const auto tus  = as_int(gps.find("TimeUS"));
    if (!week || !ms || !tus || *week <= 0) return std::nullopt;

    const int64_t utc_us =
        (kGpsEpochUnix + *week * kSecondsInWeek - kGpsLeapSecs) * 1'000'000
        + *ms * 1000;
    return utc_us - *tus;
}

} // namespace

/* ─────────────────────────────────────────────────────────── */

bool is_gzip(const std::vector<uint8_t>& bytes) noexcept
{
    return bytes.size() >= 2 && bytes[0] == 0x1f && bytes[1] == 0x8b;
}

std::vector<uint8_t> gunzip(const std::vector<uint8_t>& bytes)
{
    z_stream zs{};
    if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK)
        throw DecodeFailure("zlib inflateInit2 failed");

    zs.next_in  = const_cast<Bytef*>(bytes.data());
    zs.avail_in = static_cast<uInt>(bytes.size());

    std::vector<uint8_t> out;
    std::array<uint8_t, 1 << 16> buf{};
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        zs.next_out  = buf.data();
        zs.avail_out = static_cast<uInt>(buf.size());

        ret = ::inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            const std::string msg = zs.msg ? zs.msg : "truncated stream";
            inflateEnd(&zs);
            throw DecodeFailure("gzip inflate failed: " + msg);
        }
        out.insert(out.end(), buf.data(), buf.data() + (buf.size() - zs.avail_out));
    }

    inflateEnd(&zs);
    return out;
}

/* ─────────────────────────────────────────────────────────── */

core::DecodedRecordSet DataflashDecoder::decode(const std::filesystem::path& file)
{
    std::ifstream in(file, std::ios::binary);
    if (!in)
        throw DecodeFailure("cannot open log file: " + file.string());

    std::cout << "[DECODE] Opening log file: " << file.string() << '\n';
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad())
        throw DecodeFailure("read error on log file: " + file.string());

    return decode_bytes(std::move(bytes));
}

core::DecodedRecordSet DataflashDecoder::decode_bytes(std::vector<uint8_t> bytes) const
{
    if (is_gzip(bytes)) {
        bytes = gunzip(bytes);
        std::cout << "[DECODE] Inflated gzip log to " << bytes.size() << " bytes\n";
    }

    // FMT describes itself
    const MessageFormat fmt_fmt{kFmtId, kFmtLength, "FMT", "BBnNZ",
                                {"Type", "Length", "Name", "Format", "Columns"}};

    std::unordered_map<uint8_t, MessageFormat> formats;
    std::unordered_set<uint8_t>                 broken;   // known length, bad layout
    std::map<std::string, std::vector<core::Record>> records;
    std::optional<int64_t> utc_offset;

    std::size_t decoded = 0, skipped = 0;
    const uint8_t*    data = bytes.data();
    const std::size_t n    = bytes.size();
    std::size_t       pos  = 0;

    while (pos + kHeaderSize <= n) {
        if (data[pos] != kHead1 || data[pos + 1] != kHead2) {
            ++pos; ++skipped;                           // resync
            continue;
        }

        const uint8_t  id      = data[pos + 2];
        const uint8_t* payload = data + pos + kHeaderSize;

        /* 1. format definitions ───────────────────────────── */
        if (id == kFmtId) {
            if (pos + kFmtLength > n) break;            // truncated tail

            MessageFormat f = parse_fmt(payload);
            if (const std::string why = f.validate(); !why.empty()) {
                std::cerr << "[DECODE] Skipping message type " << f.name
                          << ": " << why << '\n';
                broken.insert(f.id);
            } else {
                broken.erase(f.id);
            }
            const uint8_t fid = f.id;
            if (f.length >= kHeaderSize) formats[fid] = std::move(f);

            auto& fmt_rows = records["FMT"];
            if (fmt_rows.size() < core::kMaxRecordsPerType)
                fmt_rows.push_back(fmt_fmt.decode(payload));

            ++decoded;
            pos += kFmtLength;
            continue;
        }

        /* 2. data messages ────────────────────────────────── */
        auto it = formats.find(id);
        if (it == formats.end()) {
            ++pos; ++skipped;
            continue;
        }

        const MessageFormat& f = it->second;
        if (pos + f.length > n) break;                  // truncated tail

        if (!broken.count(id)) {
            auto& rows = records[f.name];
            const bool want_row  = rows.size() < core::kMaxRecordsPerType;
            const bool want_time = !utc_offset && f.name == "GPS";

            if (want_row || want_time) {
                core::Record r = f.decode(payload);
                if (want_time) utc_offset = gps_utc_offset(r);
                if (want_row)  rows.push_back(std::move(r));
            }
            ++decoded;
        }
        pos += f.length;
    }

    if (decoded == 0)
        throw DecodeFailure("no DataFlash messages found in log");

    if (skipped)
        std::cerr << "[DECODE] Skipped " << skipped << " unframed bytes\n";

    /* 3. wall-clock time from GPS ────────────────────────────── */
    if (utc_offset) {
        for (auto& [type, rows] : records) {
            for (auto& r : rows) {
                if (auto tus = as_int(r.find("TimeUS")))
                    r.set("DateTime", core::Timestamp(
                        std::chrono::microseconds(*utc_offset + *tus)));
            }
        }
    }

    core::DecodedRecordSet out;
    for (auto& [type, rows] : records) {
        if (rows.empty()) continue;
        std::cout << "[DECODE] Added " << rows.size() << " messages for " << type << '\n';
        out.assign(type, std::move(rows));
    }

    std::cout << "[DECODE] " << decoded << " messages decoded, "
              << out.type_count() << " message types kept\n";
    return out;
}

} // namespace fchat::decode
