#include "pvperf/processing/inverter_analyzer.hpp"
#include "pvperf/processing/performance_ratio_engine.hpp"
#include "pvperf/processing/timestamp_index.hpp"
#include "pvperf/statistics/statistics_engine.hpp"
#include <future>

namespace pvperf {

// ============================================================================
// Batch
// ============================================================================

std::vector<InverterSummary> InverterAnalyzer::analyze_inverters(
    const std::vector<PRRow>& pr_rows,
    const std::vector<InverterSet>& inverter_sets,
    double pv_capacity_mwp,
    double efficiency_threshold,
    bool parallel
) {
    std::vector<InverterSummary> result;
    if (inverter_sets.empty()) {
        return result;
    }
    result.reserve(inverter_sets.size());

    // For a single set or when asked to, sequential
    if (!parallel || inverter_sets.size() == 1) {
        for (const auto& set : inverter_sets) {
            result.push_back(analyze_one(pr_rows, set, pv_capacity_mwp, efficiency_threshold));
        }
        return result;
    }

    // Sets are independent; futures are collected in submission order
    std::vector<std::future<InverterSummary>> futures;
    futures.reserve(inverter_sets.size());

    for (const auto& set : inverter_sets) {
        futures.push_back(std::async(std::launch::async,
            [&pr_rows, &set, pv_capacity_mwp, efficiency_threshold]() {
                return analyze_one(pr_rows, set, pv_capacity_mwp, efficiency_threshold);
            }
        ));
    }

    for (auto& f : futures) {
        result.push_back(f.get());
    }

    return result;
}

std::vector<InverterSummary> InverterAnalyzer::analyze_inverters(
    const std::vector<PRRow>& pr_rows,
    const std::vector<InverterSet>& inverter_sets,
    const AnalysisConfig& config
) {
    return analyze_inverters(
        pr_rows,
        inverter_sets,
        config.pv_capacity_mwp,
        config.efficiency_threshold,
        config.parallel_inverters
    );
}

// ============================================================================
// Single inverter
// ============================================================================

InverterSummary InverterAnalyzer::analyze_one(
    const std::vector<PRRow>& pr_rows,
    const InverterSet& inverter_set,
    double pv_capacity_mwp,
    double efficiency_threshold
) {
    InverterSummary summary;
    summary.source_id = inverter_set.source_id;

    const std::vector<double> eff = efficiencies(
        pr_rows, inverter_set, pv_capacity_mwp, &summary.matched_rows);

    summary.evaluated_rows = eff.size();
    for (double e : eff) {
        if (e < efficiency_threshold) {
            summary.low_efficiency_count++;
        }
    }

    if (!eff.empty()) {
        summary.mean_efficiency = StatisticsEngine::calculate_mean(eff.data(), eff.size());
    }

    return summary;
}

std::vector<double> InverterAnalyzer::efficiencies(
    const std::vector<PRRow>& pr_rows,
    const InverterSet& inverter_set,
    double pv_capacity_mwp,
    size_t* matched_rows
) {
    std::vector<double> result;
    size_t matched = 0;

    const TimestampIndex inverter_index(inverter_set.rows);

    for (const auto& pr_row : pr_rows) {
        const auto& positions = inverter_index.find(pr_row.timestamp);
        if (positions.empty()) {
            continue;
        }

        const double simulated =
            PerformanceRatioEngine::simulated_energy_kwh(pr_row.irradiance, pv_capacity_mwp);

        for (size_t pos : positions) {
            ++matched;
            // No theoretical output: the ratio is meaningless
            if (!(simulated > 0.0)) {
                continue;
            }
            result.push_back(inverter_set.rows[pos].value / simulated);
        }
    }

    if (matched_rows) {
        *matched_rows = matched;
    }
    return result;
}

} // namespace pvperf
