#pragma once

#include "hillmaker/core/timestamp.hpp"
#include "hillmaker/core/types.hpp"
#include <string>

namespace hillmaker::testing {

inline Timestamp ts(const std::string& text) {
    return parse_timestamp_or_throw(text);
}

/// [day 00:00:00, day 23:59:59], the window a Scenario builds for a single day
inline AnalysisWindow day_window(const std::string& day) {
    const Timestamp start = ts(day);
    return AnalysisWindow(start, start + std::chrono::seconds(constants::SECONDS_PER_DAY - 1));
}

inline StopRecord stop(const std::string& entry, const std::string& exit,
                       const char* category = nullptr, double weight = 1.0) {
    StopRecord rec(ts(entry), ts(exit));
    if (category) {
        rec.category = category;
    }
    rec.weight = weight;
    return rec;
}

} // namespace hillmaker::testing
