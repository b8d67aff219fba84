#include "hillmaker/data/csv_writer.hpp"
#include "hillmaker/core/timestamp.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <ostream>
#include <stdexcept>

namespace hillmaker {

std::string CsvWriter::format_double(double value) {
    if (std::isnan(value)) {
        return {};
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f", value);
    return buf;
}

std::string CsvWriter::escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

namespace {

void write_stats_header(std::ostream& os, const std::vector<double>& percentiles) {
    os << "count,mean,min,max,stdev,sem,var,cv,skew,kurt";
    for (double p : percentiles) {
        os << ',' << StatisticsEngine::percentile_name(p);
    }
    os << '\n';
}

void write_stats(std::ostream& os, const DescriptiveStatistics& s) {
    os << s.count << ',' << CsvWriter::format_double(s.mean) << ','
       << CsvWriter::format_double(s.min) << ',' << CsvWriter::format_double(s.max) << ','
       << CsvWriter::format_double(s.stdev) << ',' << CsvWriter::format_double(s.sem) << ','
       << CsvWriter::format_double(s.var) << ',' << CsvWriter::format_double(s.cv) << ','
       << CsvWriter::format_double(s.skew) << ',' << CsvWriter::format_double(s.kurt);
    for (double v : s.percentile_values) {
        os << ',' << CsvWriter::format_double(v);
    }
    os << '\n';
}

template<typename Writer>
void write_file(const std::string& path, Writer&& write) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    write(file);
    if (!file) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

} // namespace

void CsvWriter::write_bydatetime(std::ostream& os,
                                 const std::vector<const RollupTable*>& tables,
                                 bool include_category) {
    if (include_category) os << "category,";
    os << "datetime,arrivals,departures,occupancy,day_of_week,dow_name,"
          "bin_of_day,bin_of_day_str,bin_of_week\n";

    for (const RollupTable* table : tables) {
        for (const auto& row : table->rows) {
            if (include_category) os << escape(table->category) << ',';
            os << format_timestamp(row.datetime) << ','
               << format_double(row.arrivals) << ','
               << format_double(row.departures) << ','
               << format_double(row.occupancy) << ','
               << row.day_of_week << ','
               << row.dow_name << ','
               << row.bin_of_day << ','
               << row.bin_of_day_str << ','
               << row.bin_of_week << '\n';
        }
    }
}

void CsvWriter::write_summary(std::ostream& os, const SummaryTable& table, bool include_category) {
    if (include_category) os << "category,";
    if (!table.stationary) os << "day_of_week,dow_name,bin_of_day,bin_of_day_str,";
    write_stats_header(os, table.percentiles);

    for (const auto& row : table.rows) {
        const auto& k = row.key;
        if (include_category) os << escape(k.category) << ',';
        if (!table.stationary) {
            os << k.day_of_week << ',' << k.dow_name << ',' << k.bin_of_day << ','
               << k.bin_of_day_str << ',';
        }
        write_stats(os, row.stats);
    }
}

void CsvWriter::write_los(std::ostream& os, const LosSummary& los) {
    os << "category,";
    write_stats_header(os, los.percentiles);
    for (const auto& [category, stats] : los.by_category) {
        os << escape(category) << ',';
        write_stats(os, stats);
    }
}

void CsvWriter::write_bydatetime_file(const std::string& path,
                                      const std::vector<const RollupTable*>& tables,
                                      bool include_category) {
    write_file(path, [&](std::ostream& os) { write_bydatetime(os, tables, include_category); });
}

void CsvWriter::write_summary_file(const std::string& path, const SummaryTable& table,
                                   bool include_category) {
    write_file(path, [&](std::ostream& os) { write_summary(os, table, include_category); });
}

void CsvWriter::write_los_file(const std::string& path, const LosSummary& los) {
    write_file(path, [&](std::ostream& os) { write_los(os, los); });
}

} // namespace hillmaker
