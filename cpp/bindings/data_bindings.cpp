#include "hillmaker/data/column.hpp"
#include "hillmaker/data/csv_loader.hpp"
#include "hillmaker/data/dataframe.hpp"
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace hillmaker;

/// Float64 column as a NumPy array sharing the DataFrame's memory
py::array_t<double> float64_column_as_numpy(const DataFrame &df,
                                            const std::string &name) {
  auto cells = df.get_column<double>(name);

  // Base object keeps the DataFrame alive while the array exists
  return py::array_t<double>(cells.size(), cells.data(),
                             py::cast(&df, py::return_value_policy::reference));
}

/// Any column as text, "" for missing cells
std::vector<std::string> column_as_strings(const DataFrame &df,
                                           const std::string &name) {
  const IColumn &col = df.column(name);
  std::vector<std::string> out;
  out.reserve(col.size());
  for (size_t row = 0; row < col.size(); ++row) {
    out.push_back(col.value_as_string(row));
  }
  return out;
}

/// Table input: column types, CSV options, DataFrame
void init_data_bindings(py::module &m) {

  py::enum_<ColumnType>(m, "ColumnType", "Storage type of a DataFrame column")
      .value("FLOAT64", ColumnType::FLOAT64)
      .value("INT64", ColumnType::INT64)
      .value("STRING", ColumnType::STRING)
      .value("DATETIME", ColumnType::DATETIME, "Epoch seconds")
      .export_values();

  m.attr("MISSING_TIMESTAMP") = MISSING_TIMESTAMP;

  py::class_<CsvOptions>(m, "CsvOptions", "Options for reading stop data CSV files")
      .def(py::init<>())
      .def_readwrite("delimiter", &CsvOptions::delimiter)
      .def_readwrite("has_header", &CsvOptions::has_header)
      .def_readwrite("skip_rows", &CsvOptions::skip_rows)
      .def_readwrite("auto_detect_types", &CsvOptions::auto_detect_types)
      .def_readwrite("parse_dates", &CsvOptions::parse_dates,
                     "Let type inference produce DATETIME columns")
      .def_readwrite("infer_schema_rows", &CsvOptions::infer_schema_rows,
                     "Rows sampled for type inference")
      .def_readwrite("datetime_columns", &CsvOptions::datetime_columns,
                     "Columns always read as DATETIME, e.g. ['InRoomTS', 'OutRoomTS']");

  py::class_<DataFrame>(m, "DataFrame", "Column-oriented stop data table")
      .def(py::init<>())
      .def_static("load_csv", &DataFrame::load_csv, py::arg("path"),
                  py::arg("options") = CsvOptions(),
                  py::return_value_policy::move,
                  "Read a stop data CSV file")

      .def("add_float64", &DataFrame::add_float64, py::arg("name"), py::arg("values"))
      .def("add_int64", &DataFrame::add_int64, py::arg("name"), py::arg("values"))
      .def("add_string", &DataFrame::add_string, py::arg("name"), py::arg("values"))
      .def("add_datetime", &DataFrame::add_datetime, py::arg("name"),
           py::arg("epoch_seconds"),
           "Timestamp column from epoch seconds (MISSING_TIMESTAMP for gaps)")

      .def("get_column_f64", &float64_column_as_numpy, py::arg("name"),
           py::keep_alive<0, 1>(), "Float64 column as a zero-copy NumPy array")
      .def("get_column_i64",
           [](const DataFrame &df, const std::string &name) {
             auto cells = df.get_column<int64_t>(name);
             return std::vector<int64_t>(cells.begin(), cells.end());
           },
           py::arg("name"), "Int64 or DateTime column as a list")
      .def("get_column_str", &column_as_strings, py::arg("name"),
           "Any column as a list of strings")

      .def("row_count", &DataFrame::row_count)
      .def("column_count", &DataFrame::column_count)
      .def("column_names", &DataFrame::column_names)
      .def("column_type", &DataFrame::column_type, py::arg("name"))
      .def("has_column", &DataFrame::has_column, py::arg("name"))
      .def("__len__", &DataFrame::row_count)
      .def("__repr__", [](const DataFrame &df) {
        return "<hillmaker.DataFrame " + std::to_string(df.row_count()) +
               " stops x " + std::to_string(df.column_count()) + " columns>";
      });
}
