#include "pvperf/core/config.hpp"
#include "pvperf/core/errors.hpp"
#include "pvperf/core/types.hpp"
#include "pvperf/data/csv_table_reader.hpp"
#include "pvperf/data/raw_table.hpp"
#include "pvperf/data/table_loader.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace pvperf;

/// Initialize input-side Python bindings (tables, readers, loader)
void init_data_bindings(py::module &m) {

  // ===== Errors =====
  py::register_exception<MalformedInputError>(m, "MalformedInputError",
                                              PyExc_ValueError);

  // ===== SourceRole Enum =====
  py::enum_<SourceRole>(m, "SourceRole", "Physical source of a table")
      .value("IRRADIANCE", SourceRole::IRRADIANCE, "Environmental monitor (EM)")
      .value("REVENUE_METER", SourceRole::REVENUE_METER, "Revenue meter (RM)")
      .value("INVERTER", SourceRole::INVERTER, "Single inverter export")
      .export_values();

  // ===== TimeSeriesRow =====
  py::class_<TimeSeriesRow>(m, "TimeSeriesRow", "Sanitized (timestamp, value) sample")
      .def(py::init<>())
      .def(py::init([](std::string timestamp, double value) {
             return TimeSeriesRow{std::move(timestamp), value};
           }),
           py::arg("timestamp"), py::arg("value"))
      .def_readwrite("timestamp", &TimeSeriesRow::timestamp)
      .def_readwrite("value", &TimeSeriesRow::value)
      .def("__repr__", [](const TimeSeriesRow &r) {
        return "<TimeSeriesRow " + r.timestamp + " " + std::to_string(r.value) + ">";
      });

  // ===== RawTable =====
  py::class_<RawTable>(m, "RawTable", "Untyped spreadsheet-like table")
      .def(py::init<>(), "Create empty table")
      .def_readwrite("source_id", &RawTable::source_id)
      .def_readwrite("sheet_name", &RawTable::sheet_name)
      .def_readwrite("rows", &RawTable::rows)
      .def("row_count", &RawTable::row_count, "Number of physical rows")
      .def("__len__", &RawTable::row_count)
      .def("__repr__", [](const RawTable &t) {
        return "<RawTable source='" + t.source_id + "' sheet='" + t.sheet_name +
               "' rows=" + std::to_string(t.row_count()) + ">";
      });

  // ===== CsvReadOptions =====
  py::class_<CsvReadOptions>(m, "CsvReadOptions", "CSV reading options")
      .def(py::init<>(), "Default constructor")
      .def_readwrite("delimiter", &CsvReadOptions::delimiter,
                     "Field delimiter (default: ',')")
      .def_readwrite("sheet_name", &CsvReadOptions::sheet_name,
                     "Sheet name recorded on the table (default: '5 minutes')")
      .def_readwrite("source_id", &CsvReadOptions::source_id,
                     "Table identity (default: file name)");

  py::class_<CsvTableReader>(m, "CsvTableReader")
      .def_static("read", &CsvTableReader::read, "Read CSV file into RawTable",
                  py::arg("path"), py::arg("options") = CsvReadOptions())
      .def_static("parse", &CsvTableReader::parse, "Parse CSV text into RawTable",
                  py::arg("content"), py::arg("options") = CsvReadOptions());

  // ===== ColumnMap =====
  py::class_<ColumnMap>(m, "ColumnMap", "Fixed physical layout of one export")
      .def(py::init<>())
      .def_readwrite("sheet_name", &ColumnMap::sheet_name)
      .def_readwrite("header_row", &ColumnMap::header_row)
      .def_readwrite("first_data_row", &ColumnMap::first_data_row)
      .def_readwrite("timestamp_column", &ColumnMap::timestamp_column)
      .def_readwrite("value_column", &ColumnMap::value_column)
      .def_static("for_role", &ColumnMap::for_role, py::arg("role"));

  // ===== LoadStats =====
  py::class_<LoadStats>(m, "LoadStats", "Rows kept and dropped by one load")
      .def(py::init<>())
      .def_readonly("source_id", &LoadStats::source_id)
      .def_readonly("role", &LoadStats::role)
      .def_readonly("timestamp_header", &LoadStats::timestamp_header)
      .def_readonly("value_header", &LoadStats::value_header)
      .def_readonly("data_rows", &LoadStats::data_rows)
      .def_readonly("kept_rows", &LoadStats::kept_rows)
      .def_readonly("non_numeric_rows", &LoadStats::non_numeric_rows)
      .def_readonly("negative_rows", &LoadStats::negative_rows)
      .def_readonly("missing_timestamp_rows", &LoadStats::missing_timestamp_rows)
      .def("dropped_rows", &LoadStats::dropped_rows);

  // ===== TableLoader =====
  py::class_<TableLoader>(m, "TableLoader")
      .def_static(
          "load",
          [](const RawTable &table, SourceRole role, const ColumnMap &column_map) {
            LoadStats stats;
            TimeSeries rows = TableLoader::load(table, role, column_map, &stats);
            return py::make_tuple(std::move(rows), std::move(stats));
          },
          py::arg("table"), py::arg("role"), py::arg("column_map"),
          R"pbdoc(
                Load a raw table into (rows, stats) using an explicit layout.

                Raises MalformedInputError when the sheet is absent, the table
                has fewer than header + 2 rows, or the header is too short.
            )pbdoc")
      .def_static(
          "load",
          [](const RawTable &table, SourceRole role) {
            LoadStats stats;
            TimeSeries rows =
                TableLoader::load(table, role, ColumnMap::for_role(role), &stats);
            return py::make_tuple(std::move(rows), std::move(stats));
          },
          py::arg("table"), py::arg("role"),
          "Load a raw table into (rows, stats) using the role's fixed layout");
}
