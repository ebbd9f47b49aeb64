#include "pvperf/processing/performance_ratio_engine.hpp"
#include "pvperf/processing/issue_classifier.hpp"
#include "pvperf/processing/timestamp_index.hpp"
#include <algorithm>
#include <cmath>

namespace pvperf {

std::vector<PRRow> PerformanceRatioEngine::compute_pr(
    const TimeSeries& irradiance,
    const TimeSeries& revenue,
    double pv_capacity_mwp,
    double pr_threshold
) {
    AnalysisConfig config;
    config.pv_capacity_mwp = pv_capacity_mwp;
    config.pr_threshold = pr_threshold;
    return compute_pr(irradiance, revenue, config);
}

std::vector<PRRow> PerformanceRatioEngine::compute_pr(
    const TimeSeries& irradiance,
    const TimeSeries& revenue,
    const AnalysisConfig& config
) {
    std::vector<PRRow> rows;
    if (irradiance.empty() || revenue.empty()) {
        return rows;
    }

    const TimestampIndex revenue_index(revenue);
    rows.reserve(std::min(irradiance.size(), revenue.size()));

    for (const auto& em : irradiance) {
        for (size_t pos : revenue_index.find(em.timestamp)) {
            const auto& rm = revenue[pos];

            PRRow row;
            row.timestamp = em.timestamp;
            row.irradiance = em.value;
            row.energy_kwh = rm.value;
            // Zero irradiance gives inf (or NaN for zero energy), kept as is
            row.pr = rm.value / simulated_energy_kwh(em.value, config.pv_capacity_mwp);
            row.status = classify_status(row.pr, config.pr_threshold, config.flag_sensor_outage);
            row.issue = IssueClassifier::classify(
                row.pr, config.pr_threshold, config.soiling_factor, config.flag_sensor_outage);

            rows.push_back(std::move(row));
        }
    }

    return rows;
}

PerformanceStatus PerformanceRatioEngine::classify_status(
    double pr,
    double pr_threshold,
    bool flag_outage
) {
    if (flag_outage && !std::isfinite(pr)) {
        return PerformanceStatus::NEEDS_ATTENTION;
    }
    return pr >= pr_threshold ? PerformanceStatus::GOOD : PerformanceStatus::NEEDS_ATTENTION;
}

double PerformanceRatioEngine::simulated_energy_kwh(double irradiance, double pv_capacity_mwp) {
    return irradiance * pv_capacity_mwp * 1000.0;
}

} // namespace pvperf
