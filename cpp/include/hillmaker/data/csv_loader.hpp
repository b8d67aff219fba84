#pragma once

/**
 * @file csv_loader.hpp
 * @brief Reads stop data CSV files into a DataFrame
 *
 * Handles quoted fields (doubled quotes inside), a UTF-8 byte order mark,
 * per-column type inference over a row sample, and forced DATETIME columns.
 * Rows whose field count differs from the header are skipped.
 */

#include "hillmaker/data/dataframe.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace hillmaker {

class CsvLoader {
public:
    CsvLoader() = delete;  // Static class, no instances

    /// @throws std::runtime_error if the file cannot be read or holds no rows
    static DataFrame load(const std::string& path, const CsvOptions& opts);

    /// Same as load() for CSV text already in memory
    static DataFrame parse_csv(const char* data, size_t size, const CsvOptions& opts);

    /// Fields of one line, quotes removed
    static std::vector<std::string> split_line(const std::string& line, char delimiter);

private:
    static std::vector<ColumnType> detect_types(
        const std::vector<std::vector<std::string>>& rows,
        size_t sample_size,
        bool parse_dates
    );

    /// Whole-string numeric parses
    static bool try_parse_double(const std::string& str, double& out);
    static bool try_parse_int64(const std::string& str, int64_t& out);
};

} // namespace hillmaker
