#include "hillmaker/core/time_bins.hpp"

namespace hillmaker {

namespace {
constexpr const char* DAY_NAMES[7] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};
}

int64_t TimeBinIndexer::bin_index(Timestamp t, Timestamp origin, int bin_minutes) {
    const int64_t seconds = (t - origin).count();
    return floor_div(seconds, static_cast<int64_t>(bin_minutes) * 60);
}

int64_t TimeBinIndexer::num_bins(const AnalysisWindow& window, int bin_minutes) {
    const int64_t n = bin_index(window.end, window.start, bin_minutes) + 1;
    if (n <= 0) {
        throw NumericInvariantError("Non-positive bin count for analysis window");
    }
    return n;
}

Timestamp TimeBinIndexer::bin_start(Timestamp origin, int64_t bin, int bin_minutes) {
    return origin + std::chrono::seconds(bin * bin_minutes * 60);
}

int TimeBinIndexer::bin_of_day(Timestamp t, int bin_minutes) {
    const int64_t secs = (t - floor_day(t)).count();
    return static_cast<int>((secs / 60) / bin_minutes);
}

int TimeBinIndexer::bin_of_week(Timestamp t, int bin_minutes) {
    const int64_t secs = (t - floor_day(t)).count();
    const int64_t minutes = day_of_week(t) * constants::MINUTES_PER_DAY + secs / 60;
    return static_cast<int>(minutes / bin_minutes);
}

int TimeBinIndexer::day_of_week(Timestamp t) {
    const std::chrono::weekday wd{std::chrono::floor<std::chrono::days>(t)};
    // iso_encoding: Monday = 1 ... Sunday = 7
    return static_cast<int>(wd.iso_encoding()) - 1;
}

const char* TimeBinIndexer::day_name(int day_of_week) {
    if (day_of_week < 0 || day_of_week > 6) {
        return "???";
    }
    return DAY_NAMES[day_of_week];
}

Timestamp TimeBinIndexer::floor_day(Timestamp t) {
    return Timestamp(std::chrono::floor<std::chrono::days>(t));
}

} // namespace hillmaker
