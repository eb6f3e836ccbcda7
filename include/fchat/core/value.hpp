#pragma once
/**
 *  Decoded field values and records.
 *
 *  A record keeps its fields in decode order (the order of the
 *  message's FMT labels), which is also the order they are rendered
 *  in prompts and in the processed JSON document.
 */
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <json/json.h>

namespace fchat::core
{

using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::microseconds>;

using FieldValue = std::variant<std::monostate,   // null
                                bool,
                                int64_t,
                                uint64_t,
                                double,
                                std::string,
                                Timestamp>;

struct Field
{
    std::string name;
    FieldValue  value;

    bool operator==(const Field&) const = default;
};

class Record
{
public:
    Record() = default;
    Record(std::initializer_list<Field> fields) : fields_(fields) {}

    void set(std::string name, FieldValue v);

    [[nodiscard]] const FieldValue* find(std::string_view name) const noexcept;
    [[nodiscard]] bool contains(std::string_view name) const noexcept
    { return find(name) != nullptr; }

    const std::vector<Field>& fields() const noexcept { return fields_; }
    std::size_t size() const noexcept { return fields_.size(); }
    bool empty() const noexcept { return fields_.empty(); }

    bool operator==(const Record&) const = default;

private:
    std::vector<Field> fields_;
};

/** "YYYY-MM-DD HH:MM:SS.ffffff", UTC */
std::string format_timestamp(Timestamp ts);

/** Textual form used in prompts (timestamps in the fixed format). */
std::string to_display(const FieldValue& v);

Json::Value to_json(const FieldValue& v);
Json::Value to_json(const Record& r);

} // namespace fchat::core
