#include "pvperf/core/config.hpp"
#include "pvperf/core/timestamp.hpp"
#include "pvperf/core/types.hpp"
#include "pvperf/pipeline/analysis_pipeline.hpp"
#include "pvperf/processing/inverter_analyzer.hpp"
#include "pvperf/processing/issue_classifier.hpp"
#include "pvperf/processing/performance_ratio_engine.hpp"
#include "pvperf/statistics/statistics_engine.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace pvperf;

void bind_processing(py::module_ &m) {
  // ===== ENUMS =====

  py::enum_<PerformanceStatus>(m, "PerformanceStatus")
      .value("GOOD", PerformanceStatus::GOOD)
      .value("NEEDS_ATTENTION", PerformanceStatus::NEEDS_ATTENTION)
      .export_values();

  py::enum_<IssueLabel>(m, "IssueLabel")
      .value("NO_ISSUE", IssueLabel::NO_ISSUE)
      .value("CALIBRATION_NEEDED", IssueLabel::CALIBRATION_NEEDED)
      .value("MODULE_SOILING", IssueLabel::MODULE_SOILING)
      .value("SENSOR_OUTAGE", IssueLabel::SENSOR_OUTAGE)
      .export_values();

  m.def("status_to_string", &status_to_string, py::arg("status"));
  m.def("issue_to_string", &issue_to_string, py::arg("issue"));

  // ===== CONFIG =====

  py::class_<AnalysisConfig>(m, "AnalysisConfig", "Plant and threshold configuration")
      .def(py::init<>())
      .def_readwrite("pv_capacity_mwp", &AnalysisConfig::pv_capacity_mwp,
                     "Plant capacity in MWp (default: 2.06)")
      .def_readwrite("pr_threshold", &AnalysisConfig::pr_threshold,
                     "PR threshold (default: 0.75)")
      .def_readwrite("efficiency_threshold", &AnalysisConfig::efficiency_threshold,
                     "Inverter efficiency threshold (default: 0.90)")
      .def_readwrite("soiling_factor", &AnalysisConfig::soiling_factor,
                     "Soiling tier as a fraction of the PR threshold (default: 0.9)")
      .def_readwrite("flag_sensor_outage", &AnalysisConfig::flag_sensor_outage,
                     "Label non-finite PR as SENSOR_OUTAGE (default: True)")
      .def_readwrite("parallel_inverters", &AnalysisConfig::parallel_inverters,
                     "Analyze inverter files concurrently (default: False)")
      .def("validate", &AnalysisConfig::validate);

  // ===== ROWS =====

  py::class_<PRRow>(m, "PRRow")
      .def(py::init<>())
      .def_readonly("timestamp", &PRRow::timestamp)
      .def_readonly("irradiance", &PRRow::irradiance)
      .def_readonly("energy_kwh", &PRRow::energy_kwh)
      .def_readonly("pr", &PRRow::pr)
      .def_readonly("status", &PRRow::status)
      .def_readonly("issue", &PRRow::issue)
      .def("__repr__", [](const PRRow &r) {
        return "<PRRow " + r.timestamp + " pr=" + std::to_string(r.pr) + " " +
               status_to_string(r.status) + ">";
      });

  py::class_<InverterSet>(m, "InverterSet")
      .def(py::init<>())
      .def(py::init([](std::string source_id, TimeSeries rows) {
             return InverterSet{std::move(source_id), std::move(rows)};
           }),
           py::arg("source_id"), py::arg("rows"))
      .def_readwrite("source_id", &InverterSet::source_id)
      .def_readwrite("rows", &InverterSet::rows);

  py::class_<InverterSummary>(m, "InverterSummary")
      .def(py::init<>())
      .def_readonly("source_id", &InverterSummary::source_id)
      .def_readonly("matched_rows", &InverterSummary::matched_rows)
      .def_readonly("evaluated_rows", &InverterSummary::evaluated_rows)
      .def_readonly("low_efficiency_count", &InverterSummary::low_efficiency_count)
      .def_readonly("mean_efficiency", &InverterSummary::mean_efficiency,
                    "Mean efficiency, None when no interval was evaluated")
      .def("__repr__", [](const InverterSummary &s) {
        return "<InverterSummary " + s.source_id +
               " low=" + std::to_string(s.low_efficiency_count) + " mean=" +
               (s.mean_efficiency ? std::to_string(*s.mean_efficiency) : "None") + ">";
      });

  // ===== PERFORMANCE RATIO =====

  py::class_<PerformanceRatioEngine>(m, "PerformanceRatioEngine")
      .def_static("compute_pr",
                  py::overload_cast<const TimeSeries &, const TimeSeries &, double, double>(
                      &PerformanceRatioEngine::compute_pr),
                  py::arg("irradiance"), py::arg("revenue"),
                  py::arg("pv_capacity_mwp") = 2.06, py::arg("pr_threshold") = 0.75,
                  R"pbdoc(
                Inner-join irradiance and revenue-meter series on timestamp and
                compute pr = energy_kwh / (irradiance * pv_capacity_mwp * 1000).
            )pbdoc")
      .def_static("compute_pr_with_config",
                  py::overload_cast<const TimeSeries &, const TimeSeries &,
                                    const AnalysisConfig &>(
                      &PerformanceRatioEngine::compute_pr),
                  py::arg("irradiance"), py::arg("revenue"), py::arg("config"))
      .def_static("classify_status", &PerformanceRatioEngine::classify_status,
                  py::arg("pr"), py::arg("pr_threshold"), py::arg("flag_outage") = true);

  py::class_<IssueClassifier>(m, "IssueClassifier")
      .def_static("classify", &IssueClassifier::classify, py::arg("pr"),
                  py::arg("pr_threshold"),
                  py::arg("soiling_factor") = IssueClassifier::DEFAULT_SOILING_FACTOR,
                  py::arg("flag_outage") = true)
      .def_static("classify_issue", &IssueClassifier::classify_issue, py::arg("row"),
                  py::arg("pr_threshold"),
                  py::arg("soiling_factor") = IssueClassifier::DEFAULT_SOILING_FACTOR,
                  py::arg("flag_outage") = true);

  // ===== INVERTERS =====

  py::class_<InverterAnalyzer>(m, "InverterAnalyzer")
      .def_static("analyze_inverters",
                  py::overload_cast<const std::vector<PRRow> &,
                                    const std::vector<InverterSet> &, double, double, bool>(
                      &InverterAnalyzer::analyze_inverters),
                  py::arg("pr_rows"), py::arg("inverter_sets"),
                  py::arg("pv_capacity_mwp") = 2.06,
                  py::arg("efficiency_threshold") = 0.90, py::arg("parallel") = false,
                  py::call_guard<py::gil_scoped_release>());

  // ===== STATISTICS =====

  py::class_<ColumnStatistics>(m, "ColumnStatistics")
      .def(py::init<>())
      .def_readonly("count", &ColumnStatistics::count)
      .def_readonly("non_finite_count", &ColumnStatistics::non_finite_count)
      .def_readonly("mean", &ColumnStatistics::mean)
      .def_readonly("std_dev", &ColumnStatistics::std_dev)
      .def_readonly("min", &ColumnStatistics::min)
      .def_readonly("p25", &ColumnStatistics::p25)
      .def_readonly("median", &ColumnStatistics::median)
      .def_readonly("p75", &ColumnStatistics::p75)
      .def_readonly("max", &ColumnStatistics::max);

  py::class_<PerformanceSummary>(m, "PerformanceSummary")
      .def(py::init<>())
      .def_readonly("pr", &PerformanceSummary::pr)
      .def_readonly("good_count", &PerformanceSummary::good_count)
      .def_readonly("needs_attention_count", &PerformanceSummary::needs_attention_count)
      .def_readonly("issue_counts", &PerformanceSummary::issue_counts);

  py::class_<StatisticsEngine>(m, "StatisticsEngine")
      .def_static("describe", &StatisticsEngine::describe, py::arg("values"))
      .def_static("summarize", &StatisticsEngine::summarize, py::arg("rows"));

  m.def("parse_timestamp", &parse_timestamp, py::arg("text"),
        py::arg("day_first") = false,
        "Seconds since epoch, or None when the text is not a date");
  m.def("sort_by_time", &sort_by_time, py::arg("rows"),
        py::arg("day_first") = false,
        "Chronological copy of PR rows (unparseable timestamps last)");

  // ===== PIPELINE =====

  py::class_<SourceFailure>(m, "SourceFailure")
      .def_readonly("source_id", &SourceFailure::source_id)
      .def_readonly("role", &SourceFailure::role)
      .def_readonly("reason", &SourceFailure::reason);

  py::class_<AnalysisResult>(m, "AnalysisResult")
      .def_readonly("pr_rows", &AnalysisResult::pr_rows)
      .def_readonly("summary", &AnalysisResult::summary)
      .def_readonly("inverter_summaries", &AnalysisResult::inverter_summaries)
      .def_readonly("inverter_failures", &AnalysisResult::inverter_failures)
      .def_readonly("load_stats", &AnalysisResult::load_stats);

  m.def("run_analysis", &AnalysisPipeline::run, py::arg("em_table"),
        py::arg("rm_table"), py::arg("inverter_tables"),
        py::arg("config") = AnalysisConfig(),
        R"pbdoc(
            Run a full analysis: PR, issue labels, statistics and inverter
            summaries. Malformed EM/RM tables raise MalformedInputError;
            malformed inverter tables are listed in inverter_failures.
        )pbdoc");
}
