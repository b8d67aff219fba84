/**
 * @file hills_bindings.cpp
 * @brief Python bindings for the occupancy engine
 *
 * Timestamps cross the boundary as epoch seconds or "YYYY-MM-DD HH:MM:SS"
 * strings. No time zone conversion happens on either side.
 */

#include "hillmaker/core/diagnostics.hpp"
#include "hillmaker/core/scenario.hpp"
#include "hillmaker/core/time_bins.hpp"
#include "hillmaker/core/timestamp.hpp"
#include "hillmaker/pipeline/hills.hpp"
#include "hillmaker/statistics/statistics_engine.hpp"
#include "hillmaker/statistics/summary_engine.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace hillmaker;

namespace {

/// Accept epoch seconds (int) or a timestamp string
Timestamp to_timestamp(const py::object &value) {
  if (py::isinstance<py::str>(value)) {
    return parse_timestamp_or_throw(value.cast<std::string>());
  }
  return timestamp_from_epoch(value.cast<int64_t>());
}

py::dict stats_to_dict(const DescriptiveStatistics &s) {
  py::dict d;
  d["count"] = s.count;
  d["mean"] = s.mean;
  d["min"] = s.min;
  d["max"] = s.max;
  d["stdev"] = s.stdev;
  d["sem"] = s.sem;
  d["var"] = s.var;
  d["cv"] = s.cv;
  d["skew"] = s.skew;
  d["kurt"] = s.kurt;
  for (size_t i = 0; i < s.percentiles.size(); ++i) {
    d[py::str(StatisticsEngine::percentile_name(s.percentiles[i]))] =
        s.percentile_values[i];
  }
  return d;
}

} // namespace

void init_hills_bindings(py::module &m) {

  // ===== Enums =====
  py::enum_<EdgeBinsMode>(m, "EdgeBinsMode", "Edge bin occupancy method")
      .value("FRACTIONAL", EdgeBinsMode::FRACTIONAL,
             "Occupied fraction of the edge bin")
      .value("WHOLE_BIN", EdgeBinsMode::WHOLE_BIN, "Whole edge bin")
      .export_values();

  py::enum_<RecordRelationship>(m, "RecordRelationship",
                                "Stop interval relative to the window")
      .value("INNER", RecordRelationship::INNER)
      .value("LEFT", RecordRelationship::LEFT)
      .value("RIGHT", RecordRelationship::RIGHT)
      .value("OUTER", RecordRelationship::OUTER)
      .value("BACKWARDS", RecordRelationship::BACKWARDS)
      .value("NONE", RecordRelationship::NONE)
      .export_values();

  py::enum_<LogLevel>(m, "LogLevel", "Diagnostic event severity")
      .value("DEBUG", LogLevel::DEBUG)
      .value("INFO", LogLevel::INFO)
      .value("WARNING", LogLevel::WARNING)
      .export_values();

  // ===== StopRecord =====
  py::class_<StopRecord>(m, "StopRecord", "One entity's stay")
      .def(py::init([](const py::object &entry, const py::object &exit,
                       std::optional<std::string> category, double weight) {
             return StopRecord(to_timestamp(entry), to_timestamp(exit),
                               std::move(category), weight);
           }),
           py::arg("entry"), py::arg("exit"), py::arg("category") = py::none(),
           py::arg("weight") = 1.0)
      .def_property_readonly(
          "entry", [](const StopRecord &r) { return epoch_seconds(r.entry); },
          "Entry time (epoch seconds)")
      .def_property_readonly(
          "exit", [](const StopRecord &r) { return epoch_seconds(r.exit); },
          "Exit time (epoch seconds)")
      .def_readwrite("category", &StopRecord::category)
      .def_readwrite("weight", &StopRecord::weight)
      .def("__repr__", [](const StopRecord &r) {
        return "<StopRecord entry=" + format_timestamp(r.entry) +
               " exit=" + format_timestamp(r.exit) +
               " category=" + r.category.value_or("None") + ">";
      });

  // ===== ScenarioOptions =====
  py::class_<ScenarioOptions>(m, "ScenarioOptions", "Options of one run")
      .def(py::init<>())
      .def_readwrite("scenario_name", &ScenarioOptions::scenario_name)
      .def_readwrite("in_field", &ScenarioOptions::in_field)
      .def_readwrite("out_field", &ScenarioOptions::out_field)
      .def_readwrite("cat_field", &ScenarioOptions::cat_field)
      .def_readwrite("occ_weight_field", &ScenarioOptions::occ_weight_field)
      .def_property(
          "start_analysis_dt",
          [](const ScenarioOptions &o) {
            return format_timestamp(o.start_analysis_dt);
          },
          [](ScenarioOptions &o, const py::object &v) {
            o.start_analysis_dt = to_timestamp(v);
          },
          "Window start (str or epoch seconds)")
      .def_property(
          "end_analysis_dt",
          [](const ScenarioOptions &o) {
            return format_timestamp(o.end_analysis_dt);
          },
          [](ScenarioOptions &o, const py::object &v) {
            o.end_analysis_dt = to_timestamp(v);
          },
          "Window end date (str or epoch seconds)")
      .def_readwrite("bin_size_minutes", &ScenarioOptions::bin_size_minutes)
      .def_readwrite("highres_bin_size_minutes",
                     &ScenarioOptions::highres_bin_size_minutes)
      .def_readwrite("keep_highres_bydatetime",
                     &ScenarioOptions::keep_highres_bydatetime)
      .def_readwrite("edge_bins", &ScenarioOptions::edge_bins)
      .def_readwrite("cats_to_exclude", &ScenarioOptions::cats_to_exclude)
      .def_readwrite("percentiles", &ScenarioOptions::percentiles)
      .def_readwrite("los_units", &ScenarioOptions::los_units)
      .def_readwrite("totals", &ScenarioOptions::totals)
      .def_readwrite("nonstationary_stats", &ScenarioOptions::nonstationary_stats)
      .def_readwrite("stationary_stats", &ScenarioOptions::stationary_stats)
      .def_readwrite("export_bydatetime_csv",
                     &ScenarioOptions::export_bydatetime_csv)
      .def_readwrite("export_summaries_csv",
                     &ScenarioOptions::export_summaries_csv)
      .def_readwrite("csv_export_path", &ScenarioOptions::csv_export_path)
      .def_readwrite("parallel_categories",
                     &ScenarioOptions::parallel_categories)
      .def_readwrite("verbosity", &ScenarioOptions::verbosity);

  // ===== Rollup tables =====
  py::class_<RollupRow>(m, "RollupRow", "One reporting bin")
      .def_property_readonly(
          "datetime", [](const RollupRow &r) { return format_timestamp(r.datetime); })
      .def_readonly("arrivals", &RollupRow::arrivals)
      .def_readonly("departures", &RollupRow::departures)
      .def_readonly("occupancy", &RollupRow::occupancy)
      .def_readonly("day_of_week", &RollupRow::day_of_week)
      .def_readonly("dow_name", &RollupRow::dow_name)
      .def_readonly("bin_of_day", &RollupRow::bin_of_day)
      .def_readonly("bin_of_day_str", &RollupRow::bin_of_day_str)
      .def_readonly("bin_of_week", &RollupRow::bin_of_week);

  py::class_<RollupTable>(m, "RollupTable", "Rows of one category")
      .def_readonly("category", &RollupTable::category)
      .def_readonly("bin_minutes", &RollupTable::bin_minutes)
      .def_readonly("rows", &RollupTable::rows)
      .def("column",
           [](const RollupTable &t, const std::string &measure) {
             Measure which;
             if (measure == "arrivals") which = Measure::ARRIVALS;
             else if (measure == "departures") which = Measure::DEPARTURES;
             else if (measure == "occupancy") which = Measure::OCCUPANCY;
             else throw py::value_error("Unknown measure: " + measure);
             std::vector<double> out;
             out.reserve(t.rows.size());
             for (const auto &r : t.rows) out.push_back(r.value(which));
             return out;
           },
           py::arg("measure"), "Values of one measure in datetime order")
      .def("__len__", &RollupTable::size);

  // ===== Statistics =====
  py::class_<DescriptiveStatistics>(m, "DescriptiveStatistics")
      .def_readonly("count", &DescriptiveStatistics::count)
      .def_readonly("mean", &DescriptiveStatistics::mean)
      .def_readonly("min", &DescriptiveStatistics::min)
      .def_readonly("max", &DescriptiveStatistics::max)
      .def_readonly("stdev", &DescriptiveStatistics::stdev)
      .def_readonly("sem", &DescriptiveStatistics::sem)
      .def_readonly("var", &DescriptiveStatistics::var)
      .def_readonly("cv", &DescriptiveStatistics::cv)
      .def_readonly("skew", &DescriptiveStatistics::skew)
      .def_readonly("kurt", &DescriptiveStatistics::kurt)
      .def_readonly("percentiles", &DescriptiveStatistics::percentiles)
      .def_readonly("percentile_values",
                    &DescriptiveStatistics::percentile_values)
      .def("to_dict", &stats_to_dict, "Statistics keyed by column name");

  m.def("describe", &StatisticsEngine::describe, py::arg("data"),
        py::arg("percentiles") = std::vector<double>{0.25, 0.5, 0.75},
        "Descriptive statistics of a sample");

  py::class_<SummaryKey>(m, "SummaryKey")
      .def_readonly("category", &SummaryKey::category)
      .def_readonly("day_of_week", &SummaryKey::day_of_week)
      .def_readonly("dow_name", &SummaryKey::dow_name)
      .def_readonly("bin_of_day", &SummaryKey::bin_of_day)
      .def_readonly("bin_of_day_str", &SummaryKey::bin_of_day_str);

  py::class_<SummaryRow>(m, "SummaryRow")
      .def_readonly("key", &SummaryRow::key)
      .def_readonly("stats", &SummaryRow::stats);

  py::class_<SummaryTable>(m, "SummaryTable")
      .def_property_readonly(
          "measure", [](const SummaryTable &t) { return measure_name(t.measure); })
      .def_readonly("stationary", &SummaryTable::stationary)
      .def_readonly("percentiles", &SummaryTable::percentiles)
      .def_readonly("rows", &SummaryTable::rows)
      .def("percentile_names", &SummaryTable::percentile_names)
      .def("__len__", [](const SummaryTable &t) { return t.rows.size(); });

  py::class_<HillsSummaries>(m, "HillsSummaries")
      .def_readonly("nonstationary", &HillsSummaries::nonstationary)
      .def_readonly("stationary", &HillsSummaries::stationary);

  py::class_<LosSummary>(m, "LosSummary")
      .def_readonly("units", &LosSummary::units)
      .def_readonly("percentiles", &LosSummary::percentiles)
      .def_readonly("by_category", &LosSummary::by_category);

  // ===== Diagnostics =====
  py::class_<DiagnosticEvent>(m, "DiagnosticEvent")
      .def_readonly("level", &DiagnosticEvent::level)
      .def_readonly("category", &DiagnosticEvent::category)
      .def_readonly("message", &DiagnosticEvent::message);

  py::class_<ConservationReport>(m, "ConservationReport")
      .def_readonly("category", &ConservationReport::category)
      .def_readonly("arrivals_binned", &ConservationReport::arrivals_binned)
      .def_readonly("arrivals_expected", &ConservationReport::arrivals_expected)
      .def_readonly("departures_binned", &ConservationReport::departures_binned)
      .def_readonly("departures_expected",
                    &ConservationReport::departures_expected)
      .def_readonly("occupancy_binned_minutes",
                    &ConservationReport::occupancy_binned_minutes)
      .def_readonly("occupancy_expected_minutes",
                    &ConservationReport::occupancy_expected_minutes)
      .def_readonly("occupancy_raw_minutes",
                    &ConservationReport::occupancy_raw_minutes)
      .def_readonly("occupancy_relative_error",
                    &ConservationReport::occupancy_relative_error)
      .def("ok", &ConservationReport::ok);

  py::class_<Diagnostics>(m, "Diagnostics")
      .def("events", &Diagnostics::events)
      .def("warnings", &Diagnostics::warnings)
      .def("conservation", &Diagnostics::conservation)
      .def("relationship_counts",
           [](const Diagnostics &d) {
             std::map<std::string, std::map<std::string, size_t>> out;
             for (const auto &[cat, counts] : d.relationship_counts()) {
               for (const auto &[rel, n] : counts) {
                 out[cat][relationship_name(rel)] = n;
               }
             }
             return out;
           },
           "Counts by relationship name, per category");

  // ===== Pipeline =====
  py::class_<CancellationToken>(m, "CancellationToken")
      .def(py::init<>())
      .def("cancel", &CancellationToken::cancel)
      .def("is_cancelled", &CancellationToken::is_cancelled);

  py::class_<HillsResult>(m, "HillsResult")
      .def_readonly("options", &HillsResult::options)
      .def_readonly("cat_field", &HillsResult::cat_field)
      .def_readonly("bydatetime", &HillsResult::bydatetime)
      .def_readonly("bydatetime_highres", &HillsResult::bydatetime_highres)
      .def_readonly("summaries", &HillsResult::summaries)
      .def_readonly("los", &HillsResult::los)
      .def_readonly("diagnostics", &HillsResult::diagnostics);

  m.def("compute_hills", &compute_hills, py::arg("records"),
        py::arg("options"), py::arg("cancel") = nullptr,
        py::call_guard<py::gil_scoped_release>(),
        "Run the engine over a list of StopRecord");

  m.def("make_hills", &make_hills, py::arg("stops"), py::arg("options"),
        py::arg("cancel") = nullptr, py::call_guard<py::gil_scoped_release>(),
        "Read stop records from a DataFrame, run the engine and export CSV");

  // ===== Bin arithmetic =====
  m.def("bin_index",
        [](const py::object &t, const py::object &origin, int bin_minutes) {
          return TimeBinIndexer::bin_index(to_timestamp(t), to_timestamp(origin),
                                           bin_minutes);
        },
        py::arg("t"), py::arg("origin"), py::arg("bin_minutes"));
}
