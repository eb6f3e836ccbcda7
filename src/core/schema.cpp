#include "core/schema.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fchat::core {

SchemaEntry schema_not_found(const std::string& name)
{
    return SchemaEntry{name, "Schema not found", {}};
}

std::optional<SchemaEntry> parse_schema_entry(const Json::Value& v)
{
    if (!v.isObject()) return std::nullopt;

    const Json::Value& name   = v["MessageName"];
    const Json::Value& desc   = v["Description"];
    const Json::Value& fields = v["Fields"];
    if (!name.isString() || !desc.isString() || !fields.isArray())
        return std::nullopt;

    SchemaEntry e;
    e.name        = name.asString();
    e.description = desc.asString();
    e.fields.reserve(fields.size());

    for (const auto& f : fields) {
        if (!f.isObject() || !f["FieldName"].isString())
            return std::nullopt;
        e.fields.push_back(FieldSpec{
            f["FieldName"].asString(),
            f.get("Units", "").asString(),
            f.get("Description", "").asString()});
    }
    return e;
}

std::string format_fields(const SchemaEntry& e)
{
    std::ostringstream oss;
    for (std::size_t i = 0; i < e.fields.size(); ++i) {
        const auto& f = e.fields[i];
        if (i) oss << '\n';
        oss << "- " << f.name << " (" << f.units << "): " << f.description;
    }
    return oss.str();
}

SchemaCatalog::SchemaCatalog(std::vector<SchemaEntry> entries)
    : entries_(std::move(entries))
{
    for (std::size_t i = 0; i < entries_.size(); ++i)
        by_name_.emplace(entries_[i].name, i);          // first definition wins
}

SchemaCatalog SchemaCatalog::load_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("cannot open schema document: " + path);

    Json::CharReaderBuilder rb;
    Json::Value doc;
    std::string errs;
    if (!Json::parseFromStream(rb, in, &doc, &errs))
        throw std::runtime_error("invalid schema document " + path + ": " + errs);

    auto cat = from_json(doc);
    std::cout << "[SCHEMA] Loaded " << cat.size() << " message schemas from " << path << '\n';
    return cat;
}

SchemaCatalog SchemaCatalog::from_json(const Json::Value& doc)
{
    if (!doc.isArray())
        throw std::runtime_error("schema document must be a JSON array");

    std::vector<SchemaEntry> entries;
    entries.reserve(doc.size());

    for (const auto& item : doc) {
        if (!item.isObject() || !item["MessageName"].isString())
            continue;

        // The scraper leaves Description out for a few sections.
        Json::Value patched = item;
        if (!patched["Description"].isString()) patched["Description"] = "";
        if (!patched["Fields"].isArray())       patched["Fields"] = Json::Value(Json::arrayValue);

        if (auto e = parse_schema_entry(patched))
            entries.push_back(std::move(*e));
        else
            std::cerr << "[SCHEMA] Skipping malformed entry "
                      << item["MessageName"].asString() << '\n';
    }
    return SchemaCatalog(std::move(entries));
}

const SchemaEntry* SchemaCatalog::find(const std::string& name) const
{
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : &entries_[it->second];
}

} // namespace fchat::core
