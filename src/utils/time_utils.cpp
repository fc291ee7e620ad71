#include "utils/time_utils.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace minter::utils {
std::time_t currentUnixTime()
{
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

std::optional<std::string> formatUtcDateTime(std::time_t timestamp)
{
    // gmtime_r не использует общий статический буфер
    std::tm utcTime{};
    if (gmtime_r(&timestamp, &utcTime) == nullptr) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << std::put_time(&utcTime, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
} // namespace minter::utils
