#ifndef FORMAT_HPP
#define FORMAT_HPP

#include "types.hpp"
#include <cstdint>
#include <string>

namespace vigil {

/**
 * @file format.hpp
 * @brief Text helpers shared by the JSONL writers and date partitioning.
 */

/** @brief Escape string for safe inclusion in JSON output. */
std::string jsonEscape(const std::string& s);

/** @brief Milliseconds since the Unix epoch. */
int64_t unixMillis(WallTime t);

/** @brief UTC calendar date, YYYY-MM-DD. */
std::string utcDate(WallTime t);

/** @brief UTC date and time, YYYY-MM-DD HH:MM:SS. */
std::string utcDateTime(WallTime t);

/** @brief ISO-8601 UTC timestamp with milliseconds, e.g. 2024-05-01T12:00:00.123Z. */
std::string isoTimestamp(WallTime t);

/**
 * @brief Parse a YYYY-MM-DD partition name.
 * @return False for any other shape or an impossible date.
 */
bool parsePartitionDate(const std::string& name, int& year, int& month, int& day);

} // namespace vigil

#endif // FORMAT_HPP
