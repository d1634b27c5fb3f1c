#include <string>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <cstdlib>
#include "../include/time_utils.h"

std::string formatGitTimestamp(std::time_t when) {
    std::tm local_tm{};
    localtime_r(&when, &local_tm);

    // Offset east of UTC in seconds, daylight saving included
    long offset_sec = local_tm.tm_gmtoff;

    // Extract components
    char sign = (offset_sec >= 0) ? '+' : '-';
    long abs_offset = std::labs(offset_sec);
    long hours = abs_offset / 3600;
    long minutes = (abs_offset % 3600) / 60;

    // Format result
    std::ostringstream oss;
    oss << static_cast<long long>(when) << " "
        << sign
        << std::setw(2) << std::setfill('0') << hours
        << std::setw(2) << std::setfill('0') << minutes;

    return oss.str();
}

std::string getGitTimestamp() {
    return formatGitTimestamp(std::time(nullptr));
}
