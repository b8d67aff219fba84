#include "hillmaker/data/column.hpp"
#include "hillmaker/core/timestamp.hpp"
#include <cmath>
#include <sstream>

namespace hillmaker {

template<>
std::string TypedColumn<double>::value_as_string(size_t row) const {
    const double v = data_.at(row);
    if (std::isnan(v)) {
        return {};
    }
    // Default stream formatting: 3 stays "3", not "3.000000"
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

template<>
std::string TypedColumn<int64_t>::value_as_string(size_t row) const {
    const int64_t v = data_.at(row);
    if (type_ != ColumnType::DATETIME) {
        return std::to_string(v);
    }
    return v == MISSING_TIMESTAMP ? std::string() : format_timestamp(timestamp_from_epoch(v));
}

template<>
std::string TypedColumn<std::string>::value_as_string(size_t row) const {
    return data_.at(row);
}

template class TypedColumn<double>;
template class TypedColumn<int64_t>;
template class TypedColumn<std::string>;

std::string column_type_to_string(ColumnType type) {
    switch (type) {
        case ColumnType::FLOAT64: return "Float64";
        case ColumnType::INT64: return "Int64";
        case ColumnType::STRING: return "String";
        case ColumnType::DATETIME: return "DateTime";
    }
    return "Unknown";
}

} // namespace hillmaker
