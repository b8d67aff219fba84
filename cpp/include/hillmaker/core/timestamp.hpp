#pragma once

/**
 * @file timestamp.hpp
 * @brief Parsing and formatting of second-resolution timestamps
 */

#include "hillmaker/core/types.hpp"
#include <optional>
#include <string>

namespace hillmaker {

/**
 * @brief Parse a timestamp string
 *
 * Accepted forms:
 * - "YYYY-MM-DD", "YYYY-MM-DD HH:MM", "YYYY-MM-DD HH:MM:SS" (also with 'T')
 * - "M/D/YYYY", "M/D/YYYY H:MM", "M/D/YYYY H:MM:SS"
 *
 * Fractional seconds are truncated.
 *
 * @return Parsed timestamp, or nullopt for empty or malformed input
 */
std::optional<Timestamp> parse_timestamp(const std::string& text);

/// Like parse_timestamp but throws ValidationError on failure
Timestamp parse_timestamp_or_throw(const std::string& text);

/// "YYYY-MM-DD HH:MM:SS"
std::string format_timestamp(Timestamp t);

/// "YYYY-MM-DD"
std::string format_date(Timestamp t);

/// "HH:MM"
std::string format_time_of_day(Timestamp t);

} // namespace hillmaker
