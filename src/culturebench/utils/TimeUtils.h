#pragma once

#include <string>

namespace culturebench
{
namespace utils
{

/**
 * @brief Current UTC time as "YYYY-MM-DD HH:MM UTC" for report headers
 */
std::string getCurrentUtcTimestamp();

} // namespace utils
} // namespace culturebench
