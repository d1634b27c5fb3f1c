#pragma once

#include <string>
#include <ctime>

/**
 * @brief Formats a point in time the way Git commit objects record it.
 * The format is "<unix_timestamp> <timezone_offset>", e.g., "1672531200 +0100",
 * using the local timezone offset in effect at that time.
 */
std::string formatGitTimestamp(std::time_t when);

/**
 * @brief The current time as formatted by formatGitTimestamp().
 */
std::string getGitTimestamp();
