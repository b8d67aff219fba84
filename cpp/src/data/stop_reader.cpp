#include "hillmaker/data/stop_reader.hpp"
#include "hillmaker/core/timestamp.hpp"
#include <cmath>

namespace hillmaker {

namespace {

void require_column(const DataFrame& df, const std::string& name, const char* role) {
    if (!df.has_column(name)) {
        throw ValidationError(std::string(role) + " column '" + name + "' not found in stop data");
    }
}

// Timestamps of a DATETIME or STRING column, nullopt where missing
std::vector<std::optional<Timestamp>> read_timestamps(const DataFrame& df, const std::string& name) {
    std::vector<std::optional<Timestamp>> out;
    out.reserve(df.row_count());

    switch (df.column_type(name)) {
        case ColumnType::DATETIME: {
            for (int64_t v : df.get_column<int64_t>(name)) {
                out.push_back(v == MISSING_TIMESTAMP ? std::nullopt
                                                     : std::optional<Timestamp>(timestamp_from_epoch(v)));
            }
            break;
        }
        case ColumnType::STRING: {
            for (const auto& s : df.get_column<std::string>(name)) {
                out.push_back(parse_timestamp(s));
            }
            break;
        }
        default:
            throw ValidationError("Column '" + name + "' of type " +
                                  column_type_to_string(df.column_type(name)) +
                                  " cannot be read as timestamps");
    }
    return out;
}

std::vector<double> read_weights(const DataFrame& df, const std::string& name) {
    switch (df.column_type(name)) {
        case ColumnType::FLOAT64: {
            auto col = df.get_column<double>(name);
            return std::vector<double>(col.begin(), col.end());
        }
        case ColumnType::INT64: {
            std::vector<double> out;
            for (int64_t v : df.get_column<int64_t>(name)) {
                out.push_back(static_cast<double>(v));
            }
            return out;
        }
        default:
            throw ValidationError("Weight column '" + name + "' must be numeric");
    }
}

} // namespace

std::vector<StopRecord> StopRecordReader::read(const DataFrame& df,
                                               const StopRecordFields& fields,
                                               Diagnostics& diagnostics) {
    require_column(df, fields.in_field, "Entry");
    require_column(df, fields.out_field, "Exit");
    if (fields.cat_field) require_column(df, *fields.cat_field, "Category");
    if (fields.weight_field) require_column(df, *fields.weight_field, "Weight");

    const auto entries = read_timestamps(df, fields.in_field);
    const auto exits = read_timestamps(df, fields.out_field);
    const std::vector<double> weights = fields.weight_field
        ? read_weights(df, *fields.weight_field)
        : std::vector<double>();
    const IColumn* cat_col = fields.cat_field ? &df.column(*fields.cat_field) : nullptr;

    std::vector<StopRecord> records;
    records.reserve(df.row_count());
    size_t missing_ts = 0;
    size_t missing_weight = 0;

    for (size_t i = 0; i < df.row_count(); ++i) {
        if (!entries[i] || !exits[i]) {
            ++missing_ts;
            continue;
        }

        StopRecord rec(*entries[i], *exits[i]);
        if (!weights.empty()) {
            if (std::isnan(weights[i])) {
                ++missing_weight;
                continue;
            }
            rec.weight = weights[i];
        }
        if (cat_col) {
            std::string cat = cat_col->value_as_string(i);
            if (!cat.empty()) {
                rec.category = std::move(cat);
            }
        }
        records.push_back(std::move(rec));
    }

    if (missing_ts > 0) {
        diagnostics.warning("Dropped " + std::to_string(missing_ts) +
                            " records with missing " + fields.in_field + " or " +
                            fields.out_field);
    }
    if (missing_weight > 0) {
        diagnostics.warning("Dropped " + std::to_string(missing_weight) +
                            " records with missing weight");
    }
    diagnostics.info("Read " + std::to_string(records.size()) + " stop records");
    return records;
}

} // namespace hillmaker
