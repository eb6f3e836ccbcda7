#pragma once
#include <string>
#include <vector>

namespace fchat::core
{

struct Message
{
    std::string role;      ///< "user" | "assistant"
    std::string content;

    bool operator==(const Message&) const = default;
};

using History = std::vector<Message>;

inline constexpr const char* kGreeting =
    "Hi! I'm your ArduPilot flight data assistant. "
    "How can I help you analyze your flight logs today?";

} // namespace fchat::core
