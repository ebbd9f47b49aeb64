#pragma once

#include "pvperf/core/types.hpp"
#include <map>
#include <vector>
#include <cstddef>

namespace pvperf {

/// Descriptive statistics of a value column (non-finite values excluded)
struct ColumnStatistics {
    size_t count;            ///< Number of finite values
    size_t non_finite_count; ///< NaN / infinite values skipped
    double mean;             ///< Arithmetic mean
    double std_dev;          ///< Sample standard deviation (ddof = 1)
    double min;              ///< Minimum value
    double p25;              ///< First quartile
    double median;           ///< Median value
    double p75;              ///< Third quartile
    double max;              ///< Maximum value

    ColumnStatistics();
};

/// PR overview of one analysis run
struct PerformanceSummary {
    ColumnStatistics pr;
    size_t good_count = 0;
    size_t needs_attention_count = 0;
    /// Issue distribution over the intervals that need attention
    std::map<IssueLabel, size_t> issue_counts;
};

/// Statistics engine for PR and efficiency columns
class StatisticsEngine {
public:
    StatisticsEngine() = delete;  // Static class, no instances

    /// Count, mean, std, min, quartiles and max of the finite values.
    /// Moments are NaN when no finite value is present.
    static ColumnStatistics describe(const std::vector<double>& values);

    /// PR statistics plus status and issue distributions
    static PerformanceSummary summarize(const std::vector<PRRow>& rows);

    /// Percentile with linear interpolation between closest ranks.
    /// sorted must be ascending and non-empty; q in [0, 1].
    static double quantile_sorted(const std::vector<double>& sorted, double q);

    // ========== LOW-LEVEL STATISTICS ==========

    /// Mean (Arrow Compute for large inputs when available)
    static double calculate_mean(const double* data, size_t length);

    /// Sample standard deviation around a known mean
    static double calculate_std_dev(const double* data, size_t length, double mean);

    /// Min / max
    static void calculate_min_max(const double* data, size_t length, double& min, double& max);
};

} // namespace pvperf
