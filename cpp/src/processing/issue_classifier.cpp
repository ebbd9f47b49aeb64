#include "pvperf/processing/issue_classifier.hpp"
#include <cmath>

namespace pvperf {

IssueLabel IssueClassifier::classify(
    double pr,
    double pr_threshold,
    double soiling_factor,
    bool flag_outage
) {
    if (flag_outage && !std::isfinite(pr)) {
        return IssueLabel::SENSOR_OUTAGE;
    }

    // NaN fails both comparisons and ends up as NoIssue when not flagged
    if (pr < pr_threshold) {
        if (pr < pr_threshold * soiling_factor) {
            return IssueLabel::MODULE_SOILING;
        }
        return IssueLabel::CALIBRATION_NEEDED;
    }
    return IssueLabel::NO_ISSUE;
}

} // namespace pvperf
