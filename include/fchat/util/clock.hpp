#pragma once
#include <chrono>
#include <string>

namespace fchat::util
{

/** Local time, "YYYY-MM-DDTHH:MM:SS.ffffff" (envelope timestamps). */
std::string iso_timestamp(std::chrono::system_clock::time_point tp
                          = std::chrono::system_clock::now());

/** Local time, "YYYYmmdd_HHMMSS_ffffff" (upload file names). */
std::string file_stamp(std::chrono::system_clock::time_point tp
                       = std::chrono::system_clock::now());

} // namespace fchat::util
