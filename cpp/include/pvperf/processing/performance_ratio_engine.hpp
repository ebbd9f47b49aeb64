#pragma once

#include "pvperf/core/config.hpp"
#include "pvperf/core/types.hpp"
#include <vector>

namespace pvperf {

/// Performance ratio stage: joins irradiance with revenue-meter energy and
/// grades every shared interval against the PR threshold.
class PerformanceRatioEngine {
public:
    PerformanceRatioEngine() = delete;  // Static class, no instances

    /// Inner-join both series on exact timestamp equality and derive
    ///   pr = energy_kwh / (irradiance * pv_capacity_mwp * 1000)
    ///
    /// Timestamps present on only one side are excluded. Duplicate keys
    /// produce one row per matching pair; output follows the irradiance
    /// order. Rows with zero irradiance are kept with a non-finite PR.
    ///
    /// @param irradiance       EM series (W/m2 or kWh/m2 per interval)
    /// @param revenue          RM series (kWh per interval)
    /// @param pv_capacity_mwp  Plant capacity in MWp
    /// @param pr_threshold     PR at or above this is Good
    /// @return Joined rows with status and issue label filled in
    static std::vector<PRRow> compute_pr(
        const TimeSeries& irradiance,
        const TimeSeries& revenue,
        double pv_capacity_mwp = 2.06,
        double pr_threshold = 0.75
    );

    /// Same join, thresholds and outage handling taken from config
    static std::vector<PRRow> compute_pr(
        const TimeSeries& irradiance,
        const TimeSeries& revenue,
        const AnalysisConfig& config
    );

    /// Good iff pr >= threshold (inclusive).
    /// With flag_outage set, a non-finite PR always needs attention.
    static PerformanceStatus classify_status(
        double pr,
        double pr_threshold,
        bool flag_outage = true
    );

    /// Theoretical energy of the plant for one interval (kWh)
    static double simulated_energy_kwh(double irradiance, double pv_capacity_mwp);
};

} // namespace pvperf
