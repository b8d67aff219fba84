#include "hillmaker/data/csv_loader.hpp"
#include "hillmaker/core/timestamp.hpp"
#include "hillmaker/data/column.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace hillmaker {

namespace {

constexpr const char* UTF8_BOM = "\xEF\xBB\xBF";

std::string trim_field(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

/// Header and cell text of a CSV document, before typing
struct RawTable {
    std::vector<std::string> names;
    std::vector<std::vector<std::string>> cells;
};

RawTable read_raw_table(std::istream& in, const CsvOptions& opts) {
    RawTable raw;
    std::string line;

    for (int skipped = 0; skipped < opts.skip_rows; ++skipped) {
        if (!std::getline(in, line)) {
            throw std::runtime_error("CSV has fewer than " + std::to_string(opts.skip_rows) +
                                     " rows to skip");
        }
    }

    if (opts.has_header) {
        if (!std::getline(in, line)) {
            throw std::runtime_error("CSV is empty, expected a header row");
        }
        for (const auto& name : CsvLoader::split_line(line, opts.delimiter)) {
            raw.names.push_back(trim_field(name));
        }
        if (!raw.names.empty() && raw.names.front().rfind(UTF8_BOM, 0) == 0) {
            raw.names.front().erase(0, 3);
        }
    }

    // Short rows are padded with empty (missing) cells; long rows are an error
    size_t line_no = static_cast<size_t>(opts.skip_rows) + (opts.has_header ? 1 : 0);
    while (std::getline(in, line)) {
        ++line_no;
        if (is_blank(line)) {
            continue;
        }
        auto fields = CsvLoader::split_line(line, opts.delimiter);
        const size_t width = opts.has_header ? raw.names.size()
                           : raw.cells.empty() ? fields.size()
                                               : raw.cells.front().size();
        if (fields.size() > width) {
            throw std::runtime_error("CSV line " + std::to_string(line_no) + " has " +
                                     std::to_string(fields.size()) + " fields, expected " +
                                     std::to_string(width));
        }
        fields.resize(width);
        for (auto& f : fields) {
            f = trim_field(f);
        }
        raw.cells.push_back(std::move(fields));
    }

    if (raw.cells.empty()) {
        throw std::runtime_error("CSV holds no stop rows");
    }

    const size_t width = raw.cells.front().size();
    if (!opts.has_header) {
        for (size_t i = 0; i < width; ++i) {
            raw.names.push_back("column_" + std::to_string(i));
        }
    }
    if (raw.names.size() != width) {
        throw std::runtime_error("CSV header has " + std::to_string(raw.names.size()) +
                                 " names for " + std::to_string(width) + " columns");
    }
    return raw;
}

bool forced_datetime(const CsvOptions& opts, const std::string& name) {
    const auto& cols = opts.datetime_columns;
    return std::find(cols.begin(), cols.end(), name) != cols.end();
}

} // namespace

DataFrame CsvLoader::load(const std::string& path, const CsvOptions& opts) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open stop data file: " + path);
    }

    const std::string content((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Error while reading stop data file: " + path);
    }
    return parse_csv(content.data(), content.size(), opts);
}

DataFrame CsvLoader::parse_csv(const char* data, size_t size, const CsvOptions& opts) {
    std::istringstream in(std::string(data, size));
    const RawTable raw = read_raw_table(in, opts);
    const size_t width = raw.names.size();

    std::vector<ColumnType> types(width, ColumnType::STRING);
    if (opts.auto_detect_types) {
        const size_t sample = std::min<size_t>(
            static_cast<size_t>(std::max(opts.infer_schema_rows, 1)), raw.cells.size());
        types = detect_types(raw.cells, sample, opts.parse_dates);
    }

    for (size_t c = 0; c < width; ++c) {
        // Inference saw only a sample; an unparsable integer later on demotes the column
        if (types[c] == ColumnType::INT64) {
            int64_t ignored;
            const bool all_int = std::all_of(raw.cells.begin(), raw.cells.end(),
                [&](const std::vector<std::string>& row) {
                    return try_parse_int64(row[c], ignored);
                });
            if (!all_int) {
                types[c] = ColumnType::FLOAT64;
            }
        }
        if (forced_datetime(opts, raw.names[c])) {
            types[c] = ColumnType::DATETIME;
        }
    }

    DataFrame df;
    for (size_t c = 0; c < width; ++c) {
        const std::string& name = raw.names[c];

        switch (types[c]) {
            case ColumnType::FLOAT64: {
                std::vector<double> values;
                values.reserve(raw.cells.size());
                for (const auto& row : raw.cells) {
                    double v;
                    values.push_back(try_parse_double(row[c], v) ? v : std::nan(""));
                }
                df.add_float64(name, std::move(values));
                break;
            }
            case ColumnType::INT64: {
                std::vector<int64_t> values;
                values.reserve(raw.cells.size());
                for (const auto& row : raw.cells) {
                    int64_t v = 0;
                    if (!try_parse_int64(row[c], v)) {
                        throw std::runtime_error("Invalid integer '" + row[c] + "' in column " + name);
                    }
                    values.push_back(v);
                }
                df.add_int64(name, std::move(values));
                break;
            }
            case ColumnType::DATETIME: {
                std::vector<int64_t> values;
                values.reserve(raw.cells.size());
                for (const auto& row : raw.cells) {
                    const auto t = parse_timestamp(row[c]);
                    values.push_back(t ? epoch_seconds(*t) : MISSING_TIMESTAMP);
                }
                df.add_datetime(name, std::move(values));
                break;
            }
            case ColumnType::STRING: {
                std::vector<std::string> values;
                values.reserve(raw.cells.size());
                for (const auto& row : raw.cells) {
                    values.push_back(row[c]);
                }
                df.add_string(name, std::move(values));
                break;
            }
        }
    }
    return df;
}

// Order of preference: integer, float, datetime, string. Empty cells are
// ignored except that they keep a column from being integer.
std::vector<ColumnType> CsvLoader::detect_types(
    const std::vector<std::vector<std::string>>& rows,
    size_t sample_size,
    bool parse_dates
) {
    if (rows.empty()) {
        return {};
    }

    const size_t width = rows.front().size();
    const size_t sampled = std::min(sample_size, rows.size());
    std::vector<ColumnType> types(width, ColumnType::STRING);

    for (size_t c = 0; c < width; ++c) {
        bool ints = true;
        bool floats = true;
        bool dates = parse_dates;
        bool gaps = false;
        size_t filled = 0;

        for (size_t r = 0; r < sampled; ++r) {
            const std::string& cell = rows[r][c];
            if (cell.empty()) {
                gaps = true;
                continue;
            }
            ++filled;

            int64_t i64;
            double f64;
            ints = ints && try_parse_int64(cell, i64);
            floats = floats && try_parse_double(cell, f64);
            dates = dates && parse_timestamp(cell).has_value();
        }

        if (filled == 0) {
            types[c] = ColumnType::STRING;
        } else if (ints && !gaps) {
            types[c] = ColumnType::INT64;
        } else if (floats) {
            types[c] = ColumnType::FLOAT64;    // also integers with gaps, stored as NaN
        } else if (dates) {
            types[c] = ColumnType::DATETIME;
        }
    }
    return types;
}

bool CsvLoader::try_parse_double(const std::string& str, double& out) {
    if (str.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    out = std::strtod(str.c_str(), &end);
    return errno == 0 && end == str.c_str() + str.size();
}

bool CsvLoader::try_parse_int64(const std::string& str, int64_t& out) {
    if (str.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    out = std::strtoll(str.c_str(), &end, 10);
    return errno == 0 && end == str.c_str() + str.size();
}

std::vector<std::string> CsvLoader::split_line(const std::string& line, char delimiter) {
    std::vector<std::string> fields(1);
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                fields.back() += '"';
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == delimiter && !quoted) {
            fields.emplace_back();
        } else if ((c == '\r' || c == '\n') && !quoted) {
            break;
        } else {
            fields.back() += c;
        }
    }
    return fields;
}

} // namespace hillmaker
