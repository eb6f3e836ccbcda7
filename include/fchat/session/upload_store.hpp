#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fchat::session
{

/**
 *  Writes a reconstructed upload as <dir>/<YYYYmmdd_HHMMSS_micros><ext>,
 *  appending -1, -2, ... if that name is taken. Only the extension of
 *  `original_name` is used. Throws fchat::Error on I/O failure.
 */
std::filesystem::path save_upload(const std::filesystem::path& dir,
                                  const std::string& original_name,
                                  const std::vector<uint8_t>& bytes);

/** Extension of `name` restricted to [A-Za-z0-9.], at most 16 chars. */
std::string safe_extension(const std::string& name);

} // namespace fchat::session
