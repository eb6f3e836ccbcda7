#include "core/record_set.hpp"

namespace fchat::core {

bool DecodedRecordSet::add(const std::string& type, Record r)
{
    auto& seq = by_type_[type];
    if (seq.size() >= kMaxRecordsPerType) return false;
    seq.push_back(std::move(r));
    return true;
}

void DecodedRecordSet::assign(const std::string& type, std::vector<Record> records)
{
    if (records.size() > kMaxRecordsPerType)
        records.resize(kMaxRecordsPerType);
    by_type_[type] = std::move(records);
}

const std::vector<Record>* DecodedRecordSet::find(const std::string& type) const
{
    auto it = by_type_.find(type);
    return it == by_type_.end() ? nullptr : &it->second;
}

Json::Value DecodedRecordSet::to_json() const
{
    Json::Value messages(Json::objectValue);
    for (const auto& [type, records] : by_type_) {
        Json::Value arr(Json::arrayValue);
        for (const auto& r : records)
            arr.append(core::to_json(r));
        messages[type] = std::move(arr);
    }

    Json::Value doc(Json::objectValue);
    doc["messages"] = std::move(messages);
    return doc;
}

Record project(const Record& r, const std::vector<std::string>& required)
{
    if (required.empty()) return r;

    Record out;
    for (const auto& name : required) {
        if (const FieldValue* v = r.find(name))
            out.set(name, *v);
    }
    return out;
}

} // namespace fchat::core
