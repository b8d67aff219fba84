#pragma once

/**
 * @file dataframe.hpp
 * @brief Column-oriented table holding raw stop data
 *
 * A DataFrame is the table form of the input: one row per stop, columns
 * addressed by name. StopRecordReader turns the named entry, exit,
 * category and weight columns into StopRecords.
 */

#include "hillmaker/data/column.hpp"
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace hillmaker {

/// CSV loading options
struct CsvOptions {
    char delimiter = ',';           ///< Field delimiter
    bool has_header = true;         ///< First row holds column names
    int skip_rows = 0;              ///< Rows to skip before the header

    bool auto_detect_types = true;  ///< Infer column types (else all STRING)
    bool parse_dates = true;        ///< Allow DATETIME in type inference
    int infer_schema_rows = 1000;   ///< Rows sampled for type inference

    /// Columns always parsed as DATETIME, whatever inference says
    std::vector<std::string> datetime_columns;
};

class DataFrame {
public:
    DataFrame() = default;

    // Columns can be large; moves only
    DataFrame(const DataFrame&) = delete;
    DataFrame& operator=(const DataFrame&) = delete;
    DataFrame(DataFrame&&) = default;
    DataFrame& operator=(DataFrame&&) = default;

    /// Same as CsvLoader::load
    static DataFrame load_csv(const std::string& path, const CsvOptions& opts);

    // ===== BUILDING =====

    /// Append a column; throws std::runtime_error on duplicate name or length mismatch
    void add_column(std::shared_ptr<IColumn> column);

    void add_float64(const std::string& name, std::vector<double> values);
    void add_int64(const std::string& name, std::vector<int64_t> values);
    void add_string(const std::string& name, std::vector<std::string> values);

    /// DATETIME column from epoch seconds (MISSING_TIMESTAMP for missing cells)
    void add_datetime(const std::string& name, std::vector<int64_t> epoch_seconds);

    // ===== ACCESS =====

    /// Untyped column; throws std::runtime_error if absent
    const IColumn& column(const std::string& name) const;

    /// Cells of a column stored as T (int64_t for INT64 and DATETIME)
    template<typename T>
    std::span<const T> get_column(const std::string& name) const {
        const IColumn& col = column(name);
        const auto* typed = dynamic_cast<const TypedColumn<T>*>(&col);
        if (!typed) {
            throw std::runtime_error("Column '" + name + "' is " +
                                     column_type_to_string(col.type()) +
                                     ", not the requested storage type");
        }
        return typed->values();
    }

    bool has_column(const std::string& name) const {
        return index_.find(name) != index_.end();
    }

    ColumnType column_type(const std::string& name) const { return column(name).type(); }

    size_t row_count() const { return row_count_; }
    size_t column_count() const { return columns_.size(); }

    /// Names in insertion order
    std::vector<std::string> column_names() const;

private:
    std::vector<std::shared_ptr<IColumn>> columns_;     ///< Insertion order
    std::unordered_map<std::string, size_t> index_;     ///< Name -> position in columns_
    size_t row_count_ = 0;
};

} // namespace hillmaker
