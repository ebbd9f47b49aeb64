/**
 * @file pvperf_report.cpp
 * @brief Command-line report over EM / RM / inverter CSV exports
 *
 * Usage:
 *   pvperf_report --em EM.csv --rm RM.csv [--inverter INV.csv]...
 *                 [--capacity MWP] [--pr-threshold X] [--eff-threshold X]
 *                 [--sheet NAME] [--delimiter C] [--rows N] [--parallel]
 */

#include "pvperf/core/config.hpp"
#include "pvperf/core/errors.hpp"
#include "pvperf/core/timestamp.hpp"
#include "pvperf/core/version.hpp"
#include "pvperf/data/csv_table_reader.hpp"
#include "pvperf/pipeline/analysis_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pvperf;

// Exit codes
enum ExitCode {
    SUCCESS = 0,
    ANALYSIS_FAILED = 1,
    INVALID_ARGS = 2
};

namespace {

struct CliOptions {
    std::string em_path;
    std::string rm_path;
    std::vector<std::string> inverter_paths;
    CsvReadOptions csv;
    AnalysisConfig config;
    size_t preview_rows = 10;
};

void print_help() {
    std::cout << R"(
pvperf_report - PV plant performance report

Usage:
  pvperf_report --em FILE --rm FILE [--inverter FILE]... [options]

Options:
  --em FILE             Environmental monitor export (irradiance)
  --rm FILE             Revenue meter export (energy, kWh)
  --inverter FILE       Inverter export, repeatable
  --capacity MWP        Plant capacity in MWp (default 2.06)
  --pr-threshold X      PR threshold (default 0.75)
  --eff-threshold X     Inverter efficiency threshold (default 0.90)
  --sheet NAME          Sheet name the exports were taken from (default "5 minutes")
  --delimiter C         CSV delimiter (default ',')
  --rows N              PR rows to print (default 10)
  --parallel            Analyze inverter files concurrently
  --no-outage-flag      Keep plain comparisons for undefined PR
  --version             Print version
  --help                Show this help message

Exit Codes:
  0 - Success
  1 - Analysis failed (malformed EM/RM input, unreadable file)
  2 - Invalid arguments
)";
}

double parse_double_arg(const std::string& flag, const std::string& value) {
    try {
        size_t pos;
        double v = std::stod(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return v;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
}

size_t parse_count_arg(const std::string& flag, const std::string& value) {
    // stoul accepts "-1" and wraps it, so a sign is rejected up front
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + value + "'");
    }
    try {
        size_t pos;
        const unsigned long v = std::stoul(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return static_cast<size_t>(v);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + value + "'");
    }
}

CliOptions parse_args(int argc, char** argv) {
    CliOptions opts;

    auto next_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--em") {
            opts.em_path = next_value(i, arg);
        } else if (arg == "--rm") {
            opts.rm_path = next_value(i, arg);
        } else if (arg == "--inverter") {
            opts.inverter_paths.push_back(next_value(i, arg));
        } else if (arg == "--capacity") {
            opts.config.pv_capacity_mwp = parse_double_arg(arg, next_value(i, arg));
        } else if (arg == "--pr-threshold") {
            opts.config.pr_threshold = parse_double_arg(arg, next_value(i, arg));
        } else if (arg == "--eff-threshold") {
            opts.config.efficiency_threshold = parse_double_arg(arg, next_value(i, arg));
        } else if (arg == "--sheet") {
            opts.csv.sheet_name = next_value(i, arg);
        } else if (arg == "--delimiter") {
            const std::string d = next_value(i, arg);
            if (d.size() != 1) {
                throw std::invalid_argument("--delimiter expects a single character");
            }
            opts.csv.delimiter = d[0];
        } else if (arg == "--rows") {
            opts.preview_rows = parse_count_arg(arg, next_value(i, arg));
        } else if (arg == "--parallel") {
            opts.config.parallel_inverters = true;
        } else if (arg == "--no-outage-flag") {
            opts.config.flag_sensor_outage = false;
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }

    if (opts.em_path.empty() || opts.rm_path.empty()) {
        throw std::invalid_argument("--em and --rm are required");
    }
    return opts;
}

void print_pr_section(const AnalysisResult& result, size_t preview_rows) {
    std::cout << "\n=== Performance Ratio ===\n";
    std::cout << std::left << std::setw(22) << "Start Time"
              << std::right << std::setw(12) << "Irradiance"
              << std::setw(14) << "Energy (kWh)"
              << std::setw(12) << "PR"
              << "  " << std::left << std::setw(16) << "Status"
              << "Issue\n";

    const size_t n = std::min(preview_rows, result.pr_rows.size());
    for (size_t i = 0; i < n; ++i) {
        const auto& row = result.pr_rows[i];
        std::cout << std::left << std::setw(22) << row.timestamp
                  << std::right << std::fixed << std::setprecision(3)
                  << std::setw(12) << row.irradiance
                  << std::setw(14) << row.energy_kwh
                  << std::setprecision(5) << std::setw(12) << row.pr
                  << "  " << std::left << std::setw(16) << status_to_string(row.status)
                  << issue_to_string(row.issue) << "\n";
    }
    if (result.pr_rows.size() > n) {
        std::cout << "... " << (result.pr_rows.size() - n) << " more rows\n";
    }

    const auto& pr = result.summary.pr;
    std::cout << "\nPR statistics: count=" << pr.count
              << std::setprecision(5)
              << " mean=" << pr.mean << " std=" << pr.std_dev
              << " min=" << pr.min << " 25%=" << pr.p25
              << " 50%=" << pr.median << " 75%=" << pr.p75
              << " max=" << pr.max;
    if (pr.non_finite_count > 0) {
        std::cout << " (undefined: " << pr.non_finite_count << ")";
    }
    std::cout << "\n";

    std::cout << "Status: Good=" << result.summary.good_count
              << " Needs Attention=" << result.summary.needs_attention_count << "\n";
    for (const auto& [issue, count] : result.summary.issue_counts) {
        std::cout << "  " << issue_to_string(issue) << ": " << count << "\n";
    }

    const auto ordered = sort_by_time(result.pr_rows);
    if (!ordered.empty()) {
        std::cout << "Time span: " << ordered.front().timestamp
                  << " .. " << ordered.back().timestamp << "\n";
    }
}

void print_inverter_section(const AnalysisResult& result) {
    std::cout << "\n=== Inverter Performance ===\n";
    std::cout << std::left << std::setw(32) << "Inverter File"
              << std::right << std::setw(22) << "Low Efficiency Count"
              << std::setw(18) << "Mean Efficiency" << "\n";
    for (const auto& s : result.inverter_summaries) {
        std::cout << std::left << std::setw(32) << s.source_id
                  << std::right << std::setw(22) << s.low_efficiency_count
                  << std::setw(18);
        if (s.mean_efficiency) {
            std::cout << std::fixed << std::setprecision(4) << *s.mean_efficiency;
        } else {
            std::cout << "n/a";
        }
        std::cout << "\n";
    }
    for (const auto& f : result.inverter_failures) {
        std::cout << std::left << std::setw(32) << f.source_id << "  FAILED: " << f.reason << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_help();
            return SUCCESS;
        }
        if (arg == "--version") {
            std::cout << Version::get_build_info() << "\n";
            return SUCCESS;
        }
    }

    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_help();
        return INVALID_ARGS;
    }

    try {
        const RawTable em = CsvTableReader::read(opts.em_path, opts.csv);
        const RawTable rm = CsvTableReader::read(opts.rm_path, opts.csv);

        std::vector<RawTable> inverters;
        for (const auto& path : opts.inverter_paths) {
            try {
                inverters.push_back(CsvTableReader::read(path, opts.csv));
            } catch (const std::runtime_error& e) {
                // Unreadable inverter files don't stop the report
                std::cerr << "[REPORT] " << e.what() << "\n";
            }
        }

        const AnalysisResult result = AnalysisPipeline::run(em, rm, inverters, opts.config);

        print_pr_section(result, opts.preview_rows);
        if (opts.inverter_paths.empty()) {
            std::cout << "\nNo inverter files given, inverter analysis skipped.\n";
        } else {
            print_inverter_section(result);
        }
    } catch (const MalformedInputError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return ANALYSIS_FAILED;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return INVALID_ARGS;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return ANALYSIS_FAILED;
    }

    return SUCCESS;
}
