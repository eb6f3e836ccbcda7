#include "core/json_util.hpp"

#include <memory>

namespace fchat::core {

bool parse_json(std::string_view text, Json::Value& out, std::string* err)
{
    Json::CharReaderBuilder rb;
    rb["collectComments"] = false;
    rb["failIfExtra"]     = true;
    std::unique_ptr<Json::CharReader> reader(rb.newCharReader());

    std::string errs;
    const bool ok = reader->parse(text.data(), text.data() + text.size(), &out, &errs);
    if (!ok && err) *err = errs;
    return ok;
}

std::string to_compact(const Json::Value& v)
{
    Json::StreamWriterBuilder wb;
    wb["indentation"] = "";
    wb["emitUTF8"]    = true;
    return Json::writeString(wb, v);
}

} // namespace fchat::core
