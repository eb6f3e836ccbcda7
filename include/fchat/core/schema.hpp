#pragma once
/**
 *  Schema catalog: message-type name → field schema.
 *
 *  Loaded once from the scraped `schema.json` document
 *  ([{MessageName, Description, Fields:[{FieldName, Units, Description}]}])
 *  and read-only afterwards, so it is shared by every session.
 */
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <json/json.h>

namespace fchat::core
{

struct FieldSpec
{
    std::string name;
    std::string units;
    std::string description;

    bool operator==(const FieldSpec&) const = default;
};

struct SchemaEntry
{
    std::string            name;
    std::string            description;
    std::vector<FieldSpec> fields;

    bool operator==(const SchemaEntry&) const = default;
};

/** Placeholder used when a selected message type has no schema. */
SchemaEntry schema_not_found(const std::string& name);

/**
 *  Parses one {MessageName, Description, Fields} object.
 *  Returns nullopt on a missing key or a malformed field list.
 */
std::optional<SchemaEntry> parse_schema_entry(const Json::Value& v);

/** "- Name (units): description" per field, newline separated. */
std::string format_fields(const SchemaEntry& e);

class SchemaCatalog
{
public:
    SchemaCatalog() = default;
    explicit SchemaCatalog(std::vector<SchemaEntry> entries);

    /** Throws std::runtime_error when the document can't be read. */
    static SchemaCatalog load_file(const std::string& path);
    static SchemaCatalog from_json(const Json::Value& doc);

    [[nodiscard]] const SchemaEntry* find(const std::string& name) const;

    const std::vector<SchemaEntry>& entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }

private:
    std::vector<SchemaEntry>                     entries_;
    std::unordered_map<std::string, std::size_t> by_name_;
};

} // namespace fchat::core
