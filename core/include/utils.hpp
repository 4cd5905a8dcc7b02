#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Format a Timestamp as ISO 8601 UTC, e.g. 2024-01-01T00:00:00Z
    std::string timestampToString(const Timestamp& ts);

    // Parse "YYYY-MM-DD" (midnight UTC) or "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)"
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Seconds between two timestamps as a floating point value
    double secondsBetween(const Timestamp& from, const Timestamp& to);

} // namespace utils
} // namespace core
