/**
 * @file analysis_pipeline.cpp
 * @brief One analysis run over EM, RM and inverter exports
 */

#include "pvperf/pipeline/analysis_pipeline.hpp"
#include "pvperf/core/errors.hpp"
#include "pvperf/processing/inverter_analyzer.hpp"
#include "pvperf/processing/performance_ratio_engine.hpp"
#include <iostream>

namespace pvperf {

AnalysisResult AnalysisPipeline::run(
    const RawTable& em_table,
    const RawTable& rm_table,
    const std::vector<RawTable>& inverter_tables,
    const AnalysisConfig& config
) {
    config.validate();

    AnalysisResult result;

    // EM and RM are mandatory: a malformed table aborts the run
    LoadStats em_stats;
    const TimeSeries irradiance = TableLoader::load(
        em_table, SourceRole::IRRADIANCE, ColumnMap::for_role(SourceRole::IRRADIANCE), &em_stats);
    result.load_stats.push_back(std::move(em_stats));

    LoadStats rm_stats;
    const TimeSeries revenue = TableLoader::load(
        rm_table, SourceRole::REVENUE_METER, ColumnMap::for_role(SourceRole::REVENUE_METER), &rm_stats);
    result.load_stats.push_back(std::move(rm_stats));

    result.pr_rows = PerformanceRatioEngine::compute_pr(irradiance, revenue, config);
    result.summary = StatisticsEngine::summarize(result.pr_rows);

    std::cout << "[ANALYSIS] " << result.pr_rows.size() << " intervals joined ("
              << result.summary.good_count << " good, "
              << result.summary.needs_attention_count << " need attention)" << std::endl;

    if (inverter_tables.empty()) {
        return result;
    }

    // Inverter files are isolated: a malformed one is reported and skipped
    const ColumnMap inverter_map = ColumnMap::for_role(SourceRole::INVERTER);
    std::vector<InverterSet> inverter_sets;
    inverter_sets.reserve(inverter_tables.size());

    for (const auto& table : inverter_tables) {
        try {
            LoadStats stats;
            InverterSet set;
            set.source_id = table.source_id;
            set.rows = TableLoader::load(table, SourceRole::INVERTER, inverter_map, &stats);
            inverter_sets.push_back(std::move(set));
            result.load_stats.push_back(std::move(stats));
        } catch (const MalformedInputError& e) {
            std::cerr << "[ANALYSIS] Inverter file skipped: " << e.what() << std::endl;
            result.inverter_failures.push_back(
                SourceFailure{e.source_id(), e.role(), e.reason()});
        }
    }

    result.inverter_summaries =
        InverterAnalyzer::analyze_inverters(result.pr_rows, inverter_sets, config);

    return result;
}

} // namespace pvperf
