/*
  Performance ratio and issue classification selftest

  Join semantics (exact timestamps, one-sided rows excluded), the PR
  formula, the inclusive Good boundary, the two-tier issue rule and the
  handling of undefined PR at zero irradiance.
*/

#include "pvperf/processing/issue_classifier.hpp"
#include "pvperf/processing/performance_ratio_engine.hpp"
#include "selftest.hpp"
#include "table_fixtures.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <string>

namespace pvperf {
namespace {

using namespace selftest;
using fixtures::series;

void test_scenario_low_pr_soiling() {
    const TimeSeries irr = series({{"t1", 100.0}, {"t2", 200.0}});
    const TimeSeries rev = series({{"t1", 80.0}, {"t2", 150.0}});

    const auto rows = PerformanceRatioEngine::compute_pr(irr, rev, 1.0, 0.75);

    expect_eq(rows.size(), 2, "aligned timestamps join 1:1");
    expect_near(rows[0].pr, 0.0008, 1e-15, "PR = 80 / (100 * 1000)");
    expect_near(rows[1].pr, 0.00075, 1e-15, "PR = 150 / (200 * 1000)");
    for (const auto& r : rows) {
        expect_true(r.status == PerformanceStatus::NEEDS_ATTENTION, "low PR needs attention");
        expect_true(r.issue == IssueLabel::MODULE_SOILING, "far below threshold is soiling");
    }
    expect_near(rows[0].irradiance, 100.0, 0.0, "irradiance carried");
    expect_near(rows[0].energy_kwh, 80.0, 0.0, "energy carried");
}

void test_default_capacity() {
    // 2.06 MWp: 100 irradiance -> 206000 kWh theoretical
    const TimeSeries irr = series({{"t", 100.0}});
    const TimeSeries rev = series({{"t", 206000.0 * 0.8}});
    const auto rows = PerformanceRatioEngine::compute_pr(irr, rev);
    expect_eq(rows.size(), 1, "one row");
    expect_near(rows[0].pr, 0.8, 1e-12, "default capacity 2.06 MWp");
    expect_true(rows[0].status == PerformanceStatus::GOOD, "0.8 >= 0.75 is Good");
    expect_true(rows[0].issue == IssueLabel::NO_ISSUE, "Good row has no issue");
}

void test_inner_join_excludes_one_sided() {
    const TimeSeries irr = series({{"08:00", 1.0}, {"08:05", 2.0}, {"08:10", 3.0}, {"08:20", 4.0}});
    const TimeSeries rev = series({{"08:05", 1.0}, {"08:10", 1.0}, {"08:15", 1.0}});

    const auto rows = PerformanceRatioEngine::compute_pr(irr, rev, 1.0, 0.75);
    expect_eq(rows.size(), 2, "only shared timestamps survive");
    expect_true(rows.size() <= std::min(irr.size(), rev.size()), "count <= min(|irr|, |rev|)");
    expect_eq_str(rows[0].timestamp, "08:05", "first shared timestamp");
    expect_eq_str(rows[1].timestamp, "08:10", "second shared timestamp");

    // No tolerance window: near-identical keys don't match
    const auto none = PerformanceRatioEngine::compute_pr(
        series({{"2024-01-01 08:00:00", 1.0}}), series({{"2024-01-01 08:00", 1.0}}), 1.0, 0.75);
    expect_eq(none.size(), 0, "exact timestamp equality only");

    expect_eq(PerformanceRatioEngine::compute_pr({}, rev, 1.0, 0.75).size(), 0, "empty EM");
    expect_eq(PerformanceRatioEngine::compute_pr(irr, {}, 1.0, 0.75).size(), 0, "empty RM");
}

void test_join_follows_irradiance_order() {
    const TimeSeries irr = series({{"c", 1.0}, {"a", 1.0}, {"b", 1.0}});
    const TimeSeries rev = series({{"a", 1.0}, {"b", 1.0}, {"c", 1.0}});
    const auto rows = PerformanceRatioEngine::compute_pr(irr, rev, 1.0, 0.75);
    expect_eq(rows.size(), 3, "all keys shared");
    expect_eq_str(rows[0].timestamp + rows[1].timestamp + rows[2].timestamp, "cab",
                  "output in irradiance order");
}

void test_duplicate_keys_pair_up() {
    const TimeSeries irr = series({{"t", 1.0}, {"t", 2.0}});
    const TimeSeries rev = series({{"t", 10.0}, {"t", 20.0}});
    const auto rows = PerformanceRatioEngine::compute_pr(irr, rev, 1.0, 0.75);
    expect_eq(rows.size(), 4, "every matching pair emitted");
    expect_near(rows[0].energy_kwh, 10.0, 0.0, "pair order: first irradiance, first revenue");
    expect_near(rows[1].energy_kwh, 20.0, 0.0, "pair order: first irradiance, second revenue");
    expect_near(rows[2].irradiance, 2.0, 0.0, "pair order: second irradiance");
}

void test_status_boundary_inclusive() {
    expect_true(PerformanceRatioEngine::classify_status(0.75, 0.75) == PerformanceStatus::GOOD,
                "pr == threshold is Good");
    expect_true(PerformanceRatioEngine::classify_status(std::nextafter(0.75, 0.0), 0.75) ==
                    PerformanceStatus::NEEDS_ATTENTION,
                "just below threshold needs attention");

    // pr computed exactly at the threshold through the engine
    const auto rows = PerformanceRatioEngine::compute_pr(
        series({{"t", 1.0}}), series({{"t", 750.0}}), 1.0, 0.75);
    expect_near(rows[0].pr, 0.75, 0.0, "pr exactly 0.75");
    expect_true(rows[0].status == PerformanceStatus::GOOD, "engine keeps the boundary inclusive");
    expect_true(rows[0].issue == IssueLabel::NO_ISSUE, "boundary row has no issue");
}

void test_issue_tiers() {
    const double thr = 0.75;
    expect_true(IssueClassifier::classify(0.9, thr) == IssueLabel::NO_ISSUE, "above: no issue");
    expect_true(IssueClassifier::classify(thr, thr) == IssueLabel::NO_ISSUE, "at threshold: no issue");
    expect_true(IssueClassifier::classify(0.70, thr) == IssueLabel::CALIBRATION_NEEDED,
                "between 0.9*thr and thr: calibration");
    expect_true(IssueClassifier::classify(thr * 0.9, thr) == IssueLabel::CALIBRATION_NEEDED,
                "exactly 0.9*thr: calibration, not soiling");
    expect_true(IssueClassifier::classify(std::nextafter(thr * 0.9, 0.0), thr) ==
                    IssueLabel::MODULE_SOILING,
                "just below 0.9*thr: soiling");
    expect_true(IssueClassifier::classify(0.0, thr) == IssueLabel::MODULE_SOILING, "zero PR: soiling");

    PRRow row;
    row.pr = 0.5;
    expect_true(IssueClassifier::classify_issue(row, thr) == IssueLabel::MODULE_SOILING,
                "row overload uses the row PR");
    expect_true(IssueClassifier::classify(0.5, 0.6, 0.8) == IssueLabel::CALIBRATION_NEEDED,
                "custom soiling factor");
}

void test_undefined_pr() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    // Outage flagging (default)
    expect_true(IssueClassifier::classify(nan, 0.75) == IssueLabel::SENSOR_OUTAGE, "NaN: outage");
    expect_true(IssueClassifier::classify(inf, 0.75) == IssueLabel::SENSOR_OUTAGE, "inf: outage");
    expect_true(PerformanceRatioEngine::classify_status(inf, 0.75) ==
                    PerformanceStatus::NEEDS_ATTENTION,
                "inf PR needs attention when flagged");

    // Plain floating-point comparisons
    expect_true(IssueClassifier::classify(nan, 0.75, 0.9, false) == IssueLabel::NO_ISSUE,
                "unflagged NaN falls through to no issue");
    expect_true(PerformanceRatioEngine::classify_status(nan, 0.75, false) ==
                    PerformanceStatus::NEEDS_ATTENTION,
                "unflagged NaN fails >= and needs attention");
    expect_true(PerformanceRatioEngine::classify_status(inf, 0.75, false) ==
                    PerformanceStatus::GOOD,
                "unflagged inf compares as Good");

    // Zero irradiance rows are kept, not dropped
    const TimeSeries irr = series({{"night", 0.0}, {"dusk", 0.0}, {"day", 1.0}});
    const TimeSeries rev = series({{"night", 0.0}, {"dusk", 5.0}, {"day", 800.0}});
    const auto rows = PerformanceRatioEngine::compute_pr(irr, rev, 1.0, 0.75);
    expect_eq(rows.size(), 3, "zero-irradiance rows retained");
    expect_true(std::isnan(rows[0].pr), "0/0 is NaN");
    expect_true(std::isinf(rows[1].pr), "x/0 is infinite");
    expect_true(rows[0].issue == IssueLabel::SENSOR_OUTAGE, "NaN row labeled outage");
    expect_true(rows[1].issue == IssueLabel::SENSOR_OUTAGE, "inf row labeled outage");
    expect_true(rows[2].status == PerformanceStatus::GOOD, "daytime row graded normally");

    AnalysisConfig legacy;
    legacy.pv_capacity_mwp = 1.0;
    legacy.flag_sensor_outage = false;
    const auto plain = PerformanceRatioEngine::compute_pr(irr, rev, legacy);
    expect_true(plain[0].issue == IssueLabel::NO_ISSUE, "unflagged NaN row: no issue");
    expect_true(plain[1].status == PerformanceStatus::GOOD, "unflagged inf row: Good");
}

void test_refinement_property() {
    TimeSeries irr;
    TimeSeries rev;
    for (int i = 0; i < 200; ++i) {
        const std::string ts = "t" + std::to_string(i);
        irr.push_back(TimeSeriesRow{ts, 1.0});
        rev.push_back(TimeSeriesRow{ts, static_cast<double>(i) * 5.0});  // PR 0 .. 0.995
    }
    const auto rows = PerformanceRatioEngine::compute_pr(irr, rev, 1.0, 0.75);
    expect_eq(rows.size(), 200, "all rows joined");

    bool refined = true;
    std::set<IssueLabel> seen;
    for (const auto& r : rows) {
        seen.insert(r.issue);
        if (r.status == PerformanceStatus::GOOD && r.issue != IssueLabel::NO_ISSUE) {
            refined = false;
        }
        if (r.status == PerformanceStatus::NEEDS_ATTENTION &&
            r.issue != IssueLabel::CALIBRATION_NEEDED && r.issue != IssueLabel::MODULE_SOILING) {
            refined = false;
        }
    }
    expect_true(refined, "issue label refines status for finite PR");
    expect_eq(seen.size(), 3, "sweep covers all three finite labels");
}

void test_idempotent() {
    const TimeSeries irr = series({{"a", 3.0}, {"b", 0.0}, {"c", 7.0}});
    const TimeSeries rev = series({{"c", 1.0}, {"a", 2.0}, {"b", 0.0}});
    const auto first = PerformanceRatioEngine::compute_pr(irr, rev, 2.06, 0.75);
    const auto second = PerformanceRatioEngine::compute_pr(irr, rev, 2.06, 0.75);

    bool same = first.size() == second.size();
    for (size_t i = 0; same && i < first.size(); ++i) {
        same = first[i].timestamp == second[i].timestamp &&
               first[i].status == second[i].status &&
               first[i].issue == second[i].issue &&
               (first[i].pr == second[i].pr ||
                (std::isnan(first[i].pr) && std::isnan(second[i].pr)));
    }
    expect_true(same, "compute_pr is idempotent");
}

} // namespace
} // namespace pvperf

int main() {
    using namespace pvperf;
    test_scenario_low_pr_soiling();
    test_default_capacity();
    test_inner_join_excludes_one_sided();
    test_join_follows_irradiance_order();
    test_duplicate_keys_pair_up();
    test_status_boundary_inclusive();
    test_issue_tiers();
    test_undefined_pr();
    test_refinement_property();
    test_idempotent();
    return selftest::finish("performance_ratio");
}
