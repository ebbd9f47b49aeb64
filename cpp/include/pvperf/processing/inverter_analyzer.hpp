#pragma once

#include "pvperf/core/config.hpp"
#include "pvperf/core/types.hpp"
#include <vector>

namespace pvperf {

/// Inverter efficiency stage.
///
/// Each inverter file is joined against the PR rows on timestamp. For every
/// joined interval the plant's theoretical output is
///   simulated_energy_kwh = irradiance * pv_capacity_mwp * 1000
/// and the inverter efficiency is output / simulated. Intervals with no
/// theoretical output are not evaluated.
class InverterAnalyzer {
public:
    InverterAnalyzer() = delete;  // Static class, no instances

    /// Summarize every inverter set, one summary per set in input order.
    ///
    /// @param pr_rows              Output of the performance ratio stage
    /// @param inverter_sets        Loaded inverter files
    /// @param pv_capacity_mwp      Plant capacity in MWp
    /// @param efficiency_threshold Efficiency below this counts as low
    /// @param parallel             Analyze sets concurrently (order kept)
    static std::vector<InverterSummary> analyze_inverters(
        const std::vector<PRRow>& pr_rows,
        const std::vector<InverterSet>& inverter_sets,
        double pv_capacity_mwp = 2.06,
        double efficiency_threshold = 0.90,
        bool parallel = false
    );

    /// Same analysis, parameters taken from config
    static std::vector<InverterSummary> analyze_inverters(
        const std::vector<PRRow>& pr_rows,
        const std::vector<InverterSet>& inverter_sets,
        const AnalysisConfig& config
    );

    /// Summary of a single inverter set
    static InverterSummary analyze_one(
        const std::vector<PRRow>& pr_rows,
        const InverterSet& inverter_set,
        double pv_capacity_mwp,
        double efficiency_threshold
    );

    /// Per-interval efficiencies of one set after join and filtering
    /// (the values the summary is computed from)
    static std::vector<double> efficiencies(
        const std::vector<PRRow>& pr_rows,
        const InverterSet& inverter_set,
        double pv_capacity_mwp,
        size_t* matched_rows = nullptr
    );
};

} // namespace pvperf
