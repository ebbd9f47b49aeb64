#pragma once

#include "pvperf/core/config.hpp"
#include "pvperf/core/types.hpp"
#include "pvperf/data/raw_table.hpp"
#include "pvperf/data/table_loader.hpp"
#include "pvperf/statistics/statistics_engine.hpp"
#include <string>
#include <vector>

namespace pvperf {

/// An input file that could not be loaded
struct SourceFailure {
    std::string source_id;
    SourceRole role;
    std::string reason;
};

/// Everything one analysis run produces
struct AnalysisResult {
    std::vector<PRRow> pr_rows;
    PerformanceSummary summary;
    std::vector<InverterSummary> inverter_summaries;  ///< Loaded inverter files, input order
    std::vector<SourceFailure> inverter_failures;     ///< Inverter files skipped
    std::vector<LoadStats> load_stats;                ///< EM, RM, then loaded inverters
};

/// One analysis run: EM + RM + zero or more inverter files
class AnalysisPipeline {
public:
    AnalysisPipeline() = delete;  // Static class, no instances

    /// Run all stages.
    ///
    /// A malformed EM or RM table aborts the run (MalformedInputError is
    /// propagated). A malformed inverter table is recorded in
    /// inverter_failures and the remaining inverter files are analyzed.
    /// Throws std::invalid_argument for an invalid config.
    static AnalysisResult run(
        const RawTable& em_table,
        const RawTable& rm_table,
        const std::vector<RawTable>& inverter_tables,
        const AnalysisConfig& config = AnalysisConfig()
    );
};

} // namespace pvperf
