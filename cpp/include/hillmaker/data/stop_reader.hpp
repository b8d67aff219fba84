#pragma once

/**
 * @file stop_reader.hpp
 * @brief Builds StopRecords from named DataFrame columns
 */

#include "hillmaker/core/diagnostics.hpp"
#include "hillmaker/core/types.hpp"
#include "hillmaker/data/dataframe.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hillmaker {

/// Column names of the stop-record fields
struct StopRecordFields {
    std::string in_field;
    std::string out_field;
    std::optional<std::string> cat_field;
    std::optional<std::string> weight_field;
};

class StopRecordReader {
public:
    StopRecordReader() = delete;  // Static class, no instances

    /**
     * @brief Read one StopRecord per DataFrame row
     *
     * Timestamp columns may be DATETIME or STRING (parsed per cell). Rows
     * with a missing entry or exit timestamp, or a missing weight, are
     * dropped and reported as a single warning. Empty categories stay unset.
     *
     * @throws ValidationError if a referenced column is absent or has an unusable type
     */
    static std::vector<StopRecord> read(const DataFrame& df,
                                        const StopRecordFields& fields,
                                        Diagnostics& diagnostics);
};

} // namespace hillmaker
