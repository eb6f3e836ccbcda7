#pragma once
#include <filesystem>

#include "core/record_set.hpp"

namespace fchat::decode
{

/**
 *  Writes `records` as <dir>/<stem of source>_processed.json and returns
 *  that path. Creates `dir` if needed; throws fchat::DecodeFailure when
 *  the document can't be written.
 */
std::filesystem::path write_processed(const core::DecodedRecordSet& records,
                                      const std::filesystem::path& dir,
                                      const std::filesystem::path& source);

} // namespace fchat::decode
