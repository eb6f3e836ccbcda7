#pragma once
#include <string>
#include <string_view>

#include <json/json.h>

namespace fchat::core
{

/** false (and `err` filled) when `text` is not one complete JSON value */
bool parse_json(std::string_view text, Json::Value& out, std::string* err = nullptr);

/** Single-line serialization, UTF-8 left unescaped. */
std::string to_compact(const Json::Value& v);

} // namespace fchat::core
