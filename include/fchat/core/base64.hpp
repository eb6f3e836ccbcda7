#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fchat::core
{

/** Standard alphabet, padded. */
std::string base64_encode(const uint8_t* data, std::size_t len);

inline std::string base64_encode(const std::vector<uint8_t>& data)
{
    return base64_encode(data.data(), data.size());
}

/**
 *  Decodes standard base64; ASCII whitespace is ignored.
 *  Throws std::invalid_argument on bad length, alphabet or padding.
 */
std::vector<uint8_t> base64_decode(std::string_view text);

} // namespace fchat::core
