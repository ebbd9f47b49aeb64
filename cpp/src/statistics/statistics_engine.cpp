#include "pvperf/statistics/statistics_engine.hpp"
#include "pvperf/statistics/arrow_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace pvperf {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

#ifdef HAVE_ARROW
/// Run a scalar aggregate on a zero-copy Arrow view of the buffer
arrow::Result<arrow::Datum> call_arrow_aggregate(
    const std::string& function,
    const double* data,
    size_t length,
    const arrow::compute::FunctionOptions* options = nullptr
) {
    auto arrow_array = arrow_utils::wrap_buffer_as_arrow(data, length);
    arrow::compute::ExecContext ctx;
    return arrow::compute::CallFunction(function, {arrow::Datum(arrow_array)}, options, &ctx);
}
#endif

} // namespace

ColumnStatistics::ColumnStatistics()
    : count(0), non_finite_count(0)
    , mean(NaN), std_dev(NaN), min(NaN)
    , p25(NaN), median(NaN), p75(NaN), max(NaN)
{}

// ===== Low-level reductions =====

double StatisticsEngine::calculate_mean(const double* data, size_t length) {
    if (length == 0) {
        return NaN;
    }

#ifdef HAVE_ARROW
    // Arrow overhead only pays off for large columns
    if (length >= arrow_utils::ARROW_MIN_LENGTH && arrow_utils::is_arrow_available()) {
        auto result = call_arrow_aggregate("mean", data, length);
        if (result.ok()) {
            return result.ValueOrDie().scalar_as<arrow::DoubleScalar>().value;
        }
        std::cerr << "[STATS] Arrow mean failed: " << result.status().ToString()
                  << ". Falling back to native." << std::endl;
    }
#endif

    double sum = 0.0;
    for (size_t i = 0; i < length; ++i) {
        sum += data[i];
    }
    return sum / static_cast<double>(length);
}

double StatisticsEngine::calculate_std_dev(const double* data, size_t length, double mean) {
    // Sample deviation needs two values
    if (length < 2) {
        return NaN;
    }

#ifdef HAVE_ARROW
    if (length >= arrow_utils::ARROW_MIN_LENGTH && arrow_utils::is_arrow_available()) {
        arrow::compute::VarianceOptions options(/*ddof=*/1);
        auto result = call_arrow_aggregate("stddev", data, length, &options);
        if (result.ok()) {
            return result.ValueOrDie().scalar_as<arrow::DoubleScalar>().value;
        }
        std::cerr << "[STATS] Arrow stddev failed: " << result.status().ToString()
                  << ". Falling back to native." << std::endl;
    }
#endif

    double sum_sq = 0.0;
    for (size_t i = 0; i < length; ++i) {
        const double d = data[i] - mean;
        sum_sq += d * d;
    }
    return std::sqrt(sum_sq / static_cast<double>(length - 1));
}

void StatisticsEngine::calculate_min_max(const double* data, size_t length,
                                         double& min, double& max) {
    if (length == 0) {
        min = max = NaN;
        return;
    }

#ifdef HAVE_ARROW
    if (length >= arrow_utils::ARROW_MIN_LENGTH && arrow_utils::is_arrow_available()) {
        auto result = call_arrow_aggregate("min_max", data, length);
        if (result.ok()) {
            auto minmax_scalar = result.ValueOrDie().scalar_as<arrow::StructScalar>();
            min = std::static_pointer_cast<arrow::DoubleScalar>(minmax_scalar.value[0])->value;
            max = std::static_pointer_cast<arrow::DoubleScalar>(minmax_scalar.value[1])->value;
            return;
        }
        std::cerr << "[STATS] Arrow min_max failed: " << result.status().ToString()
                  << ". Falling back to native." << std::endl;
    }
#endif

    min = data[0];
    max = data[0];
    for (size_t i = 1; i < length; ++i) {
        if (data[i] < min) min = data[i];
        if (data[i] > max) max = data[i];
    }
}

double StatisticsEngine::quantile_sorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) {
        throw std::invalid_argument("quantile_sorted: empty input");
    }
    if (q <= 0.0) return sorted.front();
    if (q >= 1.0) return sorted.back();

    const double rank = q * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(rank));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = rank - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

// ===== Column statistics =====

ColumnStatistics StatisticsEngine::describe(const std::vector<double>& values) {
    ColumnStatistics stats;

    std::vector<double> finite;
    finite.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) {
            finite.push_back(v);
        } else {
            stats.non_finite_count++;
        }
    }

    stats.count = finite.size();
    if (finite.empty()) {
        return stats;
    }

    stats.mean = calculate_mean(finite.data(), finite.size());
    stats.std_dev = calculate_std_dev(finite.data(), finite.size(), stats.mean);
    calculate_min_max(finite.data(), finite.size(), stats.min, stats.max);

    std::sort(finite.begin(), finite.end());
    stats.p25 = quantile_sorted(finite, 0.25);
    stats.median = quantile_sorted(finite, 0.50);
    stats.p75 = quantile_sorted(finite, 0.75);

    return stats;
}

PerformanceSummary StatisticsEngine::summarize(const std::vector<PRRow>& rows) {
    PerformanceSummary summary;

    std::vector<double> pr_values;
    pr_values.reserve(rows.size());

    for (const auto& row : rows) {
        pr_values.push_back(row.pr);
        if (row.status == PerformanceStatus::GOOD) {
            summary.good_count++;
        } else {
            summary.needs_attention_count++;
            summary.issue_counts[row.issue]++;
        }
    }

    summary.pr = describe(pr_values);
    return summary;
}

} // namespace pvperf
