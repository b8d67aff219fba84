#include "hillmaker/data/dataframe.hpp"
#include "hillmaker/data/csv_loader.hpp"

namespace hillmaker {

DataFrame DataFrame::load_csv(const std::string& path, const CsvOptions& opts) {
    return CsvLoader::load(path, opts);
}

void DataFrame::add_column(std::shared_ptr<IColumn> column) {
    const std::string& name = column->name();
    if (has_column(name)) {
        throw std::runtime_error("Duplicate column: " + name);
    }
    if (!columns_.empty() && column->size() != row_count_) {
        throw std::runtime_error("Column '" + name + "' has " + std::to_string(column->size()) +
                                 " rows, table has " + std::to_string(row_count_));
    }

    row_count_ = column->size();
    index_.emplace(name, columns_.size());
    columns_.push_back(std::move(column));
}

void DataFrame::add_float64(const std::string& name, std::vector<double> values) {
    add_column(std::make_shared<Float64Column>(name, std::move(values), ColumnType::FLOAT64));
}

void DataFrame::add_int64(const std::string& name, std::vector<int64_t> values) {
    add_column(std::make_shared<Int64Column>(name, std::move(values), ColumnType::INT64));
}

void DataFrame::add_string(const std::string& name, std::vector<std::string> values) {
    add_column(std::make_shared<StringColumn>(name, std::move(values), ColumnType::STRING));
}

void DataFrame::add_datetime(const std::string& name, std::vector<int64_t> epoch_seconds) {
    add_column(std::make_shared<Int64Column>(name, std::move(epoch_seconds), ColumnType::DATETIME));
}

const IColumn& DataFrame::column(const std::string& name) const {
    const auto it = index_.find(name);
    if (it == index_.end()) {
        throw std::runtime_error("Column not found: " + name);
    }
    return *columns_[it->second];
}

std::vector<std::string> DataFrame::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& col : columns_) {
        names.push_back(col->name());
    }
    return names;
}

} // namespace hillmaker
