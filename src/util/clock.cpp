#include "util/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace fchat::util {

namespace {

std::string format_local(std::chrono::system_clock::time_point tp,
                         const char* fmt, char sep)
{
    using namespace std::chrono;

    const auto secs  = time_point_cast<seconds>(tp);
    auto micro = duration_cast<microseconds>(tp - secs).count();
    if (micro < 0) micro = 0;

    const std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, fmt) << sep
        << std::setw(6) << std::setfill('0') << micro;
    return oss.str();
}

} // namespace

std::string iso_timestamp(std::chrono::system_clock::time_point tp)
{
    return format_local(tp, "%Y-%m-%dT%H:%M:%S", '.');
}

std::string file_stamp(std::chrono::system_clock::time_point tp)
{
    return format_local(tp, "%Y%m%d_%H%M%S", '_');
}

} // namespace fchat::util
