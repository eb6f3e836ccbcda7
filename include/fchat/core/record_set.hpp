#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <json/json.h>

#include "core/value.hpp"

namespace fchat::core
{

constexpr std::size_t kMaxRecordsPerType = 10;

/**
 *  Decoded records of one uploaded log, grouped by message type.
 *  Each type keeps at most kMaxRecordsPerType records (the first ones).
 */
class DecodedRecordSet
{
public:
    /** false once the type is full; the record is then dropped */
    bool add(const std::string& type, Record r);

    /** Replaces the whole sequence of a type, truncating to the cap. */
    void assign(const std::string& type, std::vector<Record> records);

    void erase(const std::string& type) { by_type_.erase(type); }

    [[nodiscard]] const std::vector<Record>* find(const std::string& type) const;

    const std::map<std::string, std::vector<Record>>& types() const noexcept
    { return by_type_; }

    std::size_t type_count() const noexcept { return by_type_.size(); }
    bool empty() const noexcept { return by_type_.empty(); }

    /** {"messages": {TYPE: [record, ...]}} */
    Json::Value to_json() const;

private:
    std::map<std::string, std::vector<Record>> by_type_;
};

/**
 *  Keeps only `required` fields of `r`, in `required` order.
 *  Fields absent from `r` are omitted. An empty list keeps `r` as is.
 */
Record project(const Record& r, const std::vector<std::string>& required);

} // namespace fchat::core
