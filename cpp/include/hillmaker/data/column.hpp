#pragma once

/**
 * @file column.hpp
 * @brief Typed, contiguous columns of a stop-record table
 *
 * DATETIME columns share the int64 storage of INT64 columns and hold epoch
 * seconds, with MISSING_TIMESTAMP marking empty or unparsable cells.
 */

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace hillmaker {

/// Column data types
enum class ColumnType {
    FLOAT64,    ///< 64-bit floating point, NaN for missing cells
    INT64,      ///< 64-bit integer
    STRING,     ///< Text, empty for missing cells
    DATETIME    ///< Epoch seconds
};

/// Value of a DATETIME cell that could not be parsed or was empty
constexpr int64_t MISSING_TIMESTAMP = std::numeric_limits<int64_t>::min();

/// Untyped column interface
class IColumn {
public:
    virtual ~IColumn() = default;

    virtual ColumnType type() const = 0;
    virtual size_t size() const = 0;
    virtual const std::string& name() const = 0;

    /// Cell rendered as text (empty for missing values); used for category labels
    virtual std::string value_as_string(size_t row) const = 0;
};

template<typename T>
class TypedColumn : public IColumn {
public:
    TypedColumn(std::string name, std::vector<T> data, ColumnType type)
        : name_(std::move(name))
        , data_(std::move(data))
        , type_(type)
    {}

    /// Read-only view of the cells (zero-copy)
    std::span<const T> values() const {
        return std::span<const T>(data_.data(), data_.size());
    }

    ColumnType type() const override { return type_; }
    size_t size() const override { return data_.size(); }
    const std::string& name() const override { return name_; }
    std::string value_as_string(size_t row) const override;

private:
    std::string name_;
    std::vector<T> data_;
    ColumnType type_;
};

template<> std::string TypedColumn<double>::value_as_string(size_t row) const;
template<> std::string TypedColumn<int64_t>::value_as_string(size_t row) const;
template<> std::string TypedColumn<std::string>::value_as_string(size_t row) const;

using Float64Column = TypedColumn<double>;
using Int64Column = TypedColumn<int64_t>;   ///< INT64 and DATETIME columns
using StringColumn = TypedColumn<std::string>;

/// "Float64", "Int64", "String", "DateTime"
std::string column_type_to_string(ColumnType type);

} // namespace hillmaker
