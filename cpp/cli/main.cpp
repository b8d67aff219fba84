/*
================================================================================
hillmaker_cli - occupancy, arrival and departure statistics from stop data

Usage:
  hillmaker_cli <scenario> <stop_data_csv> <in_field> <out_field> <start> <end>
                [options]

Loads the stop data CSV, runs the engine with both CSV exports enabled and
prints a short run summary. Exit codes are stable for scripting.
================================================================================
*/

#include "hillmaker/core/timestamp.hpp"
#include "hillmaker/core/types.hpp"
#include "hillmaker/core/version.hpp"
#include "hillmaker/data/csv_loader.hpp"
#include "hillmaker/pipeline/hills.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace hillmaker;

// Exit codes for scripting
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

void print_help() {
  std::cout << R"(
hillmaker_cli - occupancy, arrival and departure statistics by time of day

Usage:
  hillmaker_cli <scenario> <stop_data_csv> <in_field> <out_field> <start> <end>
                [options]

Arguments:
  scenario                 Scenario name, prefix of the output files
  stop_data_csv            CSV file with one row per stop
  in_field, out_field      Entry and exit timestamp columns
  start, end               Analysis dates (YYYY-MM-DD)

Options:
  --cat_field F            Category column
  --occ_weight_field F     Occupancy weight column
  --bin_size_mins N        Report bin size in minutes (default 60)
  --highres_bin_size_mins N  Fine bin size in minutes (default 5)
  --edge_bins 1|2          1 = fractional (default), 2 = whole bin
  --keep_highres           Also export fine-resolution tables
  --no_totals              Skip the cross-category total
  --cats_to_exclude A,B    Categories to ignore
  --los_units U            Length of stay units (default hours)
  --output_path P          Output directory (default .)
  --verbose N              0 warnings, 1 info, 2 debug
  -h, --help               Show this help message

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
  4 - I/O error
)";
}

bool parse_int(const std::string& text, int& out) {
  char* end = nullptr;
  const long v = std::strtol(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0') {
    return false;
  }
  out = static_cast<int>(v);
  return true;
}

std::vector<std::string> split_list(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

/// Fill options from argv; returns false with a message on bad arguments
bool parse_args(int argc, char** argv, ScenarioOptions& opts, std::string& csv_path,
                std::string& error) {
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&](std::string& value) {
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      value = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "--cat_field") {
      if (!next(value)) return false;
      opts.cat_field = value;
    } else if (arg == "--occ_weight_field") {
      if (!next(value)) return false;
      opts.occ_weight_field = value;
    } else if (arg == "--bin_size_mins") {
      if (!next(value)) return false;
      if (!parse_int(value, opts.bin_size_minutes)) {
        error = "Invalid --bin_size_mins: " + value;
        return false;
      }
    } else if (arg == "--highres_bin_size_mins") {
      if (!next(value)) return false;
      if (!parse_int(value, opts.highres_bin_size_minutes)) {
        error = "Invalid --highres_bin_size_mins: " + value;
        return false;
      }
    } else if (arg == "--edge_bins") {
      if (!next(value)) return false;
      if (value == "1") {
        opts.edge_bins = EdgeBinsMode::FRACTIONAL;
      } else if (value == "2") {
        opts.edge_bins = EdgeBinsMode::WHOLE_BIN;
      } else {
        error = "Invalid --edge_bins: " + value + " (expected 1 or 2)";
        return false;
      }
    } else if (arg == "--keep_highres") {
      opts.keep_highres_bydatetime = true;
    } else if (arg == "--no_totals") {
      opts.totals = false;
    } else if (arg == "--cats_to_exclude") {
      if (!next(value)) return false;
      opts.cats_to_exclude = split_list(value);
    } else if (arg == "--los_units") {
      if (!next(value)) return false;
      opts.los_units = value;
    } else if (arg == "--output_path") {
      if (!next(value)) return false;
      opts.csv_export_path = value;
    } else if (arg == "--verbose") {
      if (!next(value)) return false;
      if (!parse_int(value, opts.verbosity)) {
        error = "Invalid --verbose: " + value;
        return false;
      }
    } else if (arg.rfind("--", 0) == 0) {
      error = "Unknown option: " + arg;
      return false;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() != 6) {
    error = "Expected 6 positional arguments, got " + std::to_string(positional.size());
    return false;
  }

  opts.scenario_name = positional[0];
  csv_path = positional[1];
  opts.in_field = positional[2];
  opts.out_field = positional[3];

  auto start = parse_timestamp(positional[4]);
  auto end = parse_timestamp(positional[5]);
  if (!start || !end) {
    error = "Cannot parse analysis dates '" + positional[4] + "', '" + positional[5] + "'";
    return false;
  }
  opts.start_analysis_dt = *start;
  opts.end_analysis_dt = *end;
  return true;
}

void print_summary(const HillsResult& result) {
  std::cout << "Scenario: " << result.options.scenario_name << "\n";
  std::cout << "Window: " << format_timestamp(result.options.start_analysis_dt) << " - "
            << format_timestamp(result.options.end_analysis_dt) << "\n";
  std::cout << "Bins: " << result.options.bin_size_minutes << " min report, "
            << result.options.highres_bin_size_minutes << " min fine\n";

  std::cout << "Records by relationship: "
            << format_relationship_counts(result.diagnostics.total_relationship_counts())
            << "\n";

  for (const auto& [category, table] : result.bydatetime) {
    double arrivals = 0.0;
    double occupancy_peak = 0.0;
    for (const auto& row : table.rows) {
      arrivals += row.arrivals;
      occupancy_peak = std::max(occupancy_peak, row.occupancy);
    }
    std::cout << "  " << category << ": " << table.size() << " bins, "
              << arrivals << " arrivals, peak occupancy " << occupancy_peak << "\n";
  }

  const auto warnings = result.diagnostics.warnings();
  std::cout << "Warnings: " << warnings.size() << "\n";
  std::cout << "Output: " << result.options.csv_export_path << "\n";
}

int main(int argc, char** argv) {
  if (argc >= 2) {
    const std::string first = argv[1];
    if (first == "help" || first == "-h" || first == "--help") {
      print_help();
      return ExitCode::SUCCESS;
    }
    if (first == "--version") {
      std::cout << "hillmaker " << Version::get_version_string() << "\n";
      return ExitCode::SUCCESS;
    }
  }

  ScenarioOptions opts;
  opts.export_bydatetime_csv = true;
  opts.export_summaries_csv = true;

  std::string csv_path;
  std::string error;
  if (!parse_args(argc, argv, opts, csv_path, error)) {
    std::cerr << "Error: " << error << "\n";
    std::cerr << "Run 'hillmaker_cli --help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }

  DataFrame stops;
  try {
    CsvOptions csv_opts;
    csv_opts.datetime_columns = {opts.in_field, opts.out_field};
    stops = CsvLoader::load(csv_path, csv_opts);
  } catch (const std::exception& e) {
    std::cerr << "I/O error: " << e.what() << "\n";
    return ExitCode::IO_ERROR;
  }

  try {
    HillsResult result = make_hills(stops, opts);
    print_summary(result);
    return ExitCode::SUCCESS;

  } catch (const ValidationError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const std::filesystem::filesystem_error& e) {
    std::cerr << "I/O error: " << e.what() << "\n";
    return ExitCode::IO_ERROR;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }
}
