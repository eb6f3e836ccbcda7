#include "core/base64.hpp"

#include <cctype>
#include <stdexcept>

#include <openssl/evp.h>

namespace fchat::core {

std::string base64_encode(const uint8_t* data, std::size_t len)
{
    if (len == 0) return {};

    std::string out(4 * ((len + 2) / 3), '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data, static_cast<int>(len));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::vector<uint8_t> base64_decode(std::string_view text)
{
    std::string clean;
    clean.reserve(text.size());
    for (char c : text)
        if (!std::isspace(static_cast<unsigned char>(c))) clean.push_back(c);

    if (clean.empty()) return {};
    if (clean.size() % 4 != 0)
        throw std::invalid_argument("base64: length is not a multiple of 4");

    std::size_t pad = 0;
    if (clean.back() == '=')                     ++pad;
    if (clean[clean.size() - 2] == '=')          ++pad;

    std::vector<uint8_t> out(clean.size() / 4 * 3);
    const int n = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (n < 0)
        throw std::invalid_argument("base64: invalid character");

    // EVP_DecodeBlock counts padding as decoded zero bytes
    out.resize(static_cast<std::size_t>(n) - pad);
    return out;
}

} // namespace fchat::core
