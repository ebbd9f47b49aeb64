#pragma once

#include "pvperf/core/types.hpp"

namespace pvperf {

/// Two-tier diagnosis of a PR value:
///   pr >= threshold               -> NoIssue
///   pr <  threshold * 0.9         -> ModuleSoiling
///   otherwise                     -> CalibrationNeeded
/// A non-finite PR is SensorOutage when flag_outage is set; otherwise it
/// falls through the plain floating-point comparisons.
class IssueClassifier {
public:
    IssueClassifier() = delete;  // Static class, no instances

    static constexpr double DEFAULT_SOILING_FACTOR = 0.9;

    /// Classify a bare PR value
    static IssueLabel classify(
        double pr,
        double pr_threshold,
        double soiling_factor = DEFAULT_SOILING_FACTOR,
        bool flag_outage = true
    );

    /// Classify a row produced by the performance ratio stage
    static IssueLabel classify_issue(
        const PRRow& row,
        double pr_threshold,
        double soiling_factor = DEFAULT_SOILING_FACTOR,
        bool flag_outage = true
    ) {
        return classify(row.pr, pr_threshold, soiling_factor, flag_outage);
    }
};

} // namespace pvperf
