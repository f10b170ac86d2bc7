#include "TimeUtils.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace culturebench
{
namespace utils
{

std::string getCurrentUtcTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%d %H:%M UTC");
    return ss.str();
}

} // namespace utils
} // namespace culturebench
