#include "core/value.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fchat::core {

void Record::set(std::string name, FieldValue v)
{
    for (auto& f : fields_) {
        if (f.name == name) {
            f.value = std::move(v);
            return;
        }
    }
    fields_.push_back(Field{std::move(name), std::move(v)});
}

const FieldValue* Record::find(std::string_view name) const noexcept
{
    for (const auto& f : fields_)
        if (f.name == name) return &f.value;
    return nullptr;
}

std::string format_timestamp(Timestamp ts)
{
    using namespace std::chrono;

    const auto secs  = floor<seconds>(ts);
    const auto micro = duration_cast<microseconds>(ts - secs).count();

    const std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micro;
    return oss.str();
}

namespace {

std::string format_double(double d)
{
    if (!std::isfinite(d)) return std::isnan(d) ? "nan" : (d > 0 ? "inf" : "-inf");
    std::ostringstream oss;
    oss << std::setprecision(10) << d;
    return oss.str();
}

} // namespace

std::string to_display(const FieldValue& v)
{
    struct Visitor {
        std::string operator()(std::monostate) const       { return "None"; }
        std::string operator()(bool b) const               { return b ? "True" : "False"; }
        std::string operator()(int64_t i) const            { return std::to_string(i); }
        std::string operator()(uint64_t u) const           { return std::to_string(u); }
        std::string operator()(double d) const             { return format_double(d); }
        std::string operator()(const std::string& s) const { return s; }
        std::string operator()(Timestamp ts) const         { return format_timestamp(ts); }
    };
    return std::visit(Visitor{}, v);
}

Json::Value to_json(const FieldValue& v)
{
    struct Visitor {
        Json::Value operator()(std::monostate) const       { return Json::Value(Json::nullValue); }
        Json::Value operator()(bool b) const               { return Json::Value(b); }
        Json::Value operator()(int64_t i) const            { return Json::Value(static_cast<Json::Int64>(i)); }
        Json::Value operator()(uint64_t u) const           { return Json::Value(static_cast<Json::UInt64>(u)); }
        Json::Value operator()(double d) const
        {
            if (!std::isfinite(d)) return Json::Value(Json::nullValue);
            return Json::Value(d);
        }
        Json::Value operator()(const std::string& s) const { return Json::Value(s); }
        Json::Value operator()(Timestamp ts) const         { return Json::Value(format_timestamp(ts)); }
    };
    return std::visit(Visitor{}, v);
}

Json::Value to_json(const Record& r)
{
    Json::Value obj(Json::objectValue);
    for (const auto& f : r.fields())
        obj[f.name] = to_json(f.value);
    return obj;
}

} // namespace fchat::core
