#pragma once
/**
 * @file csv_report.h
 * @brief CSV export of per-run bins and cross-run analyses.
 *
 * Files written by WriteReports into the output directory:
 *   bins.csv, gradient_buckets.csv, pace_by_gradient.csv,
 *   grade_adjustment.csv, adjustment_view.csv
 */

#include "gradepace/common/run_result.h"
#include "gradepace/stats/gradient_analysis.h"

#include <string>
#include <vector>

namespace gradepace::io {

// "m:ss" per km ("N/A" for missing, non-finite or non-positive paces).
std::string FormatPace(double min_per_km);

// "HH:MM:SS".
std::string FormatDuration(double seconds);

// @throws std::runtime_error when a file cannot be written.
void WriteBinsCsv(const std::string& path, const std::vector<RunResult>& runs);
void WriteGradientBucketsCsv(const std::string& path, const stats::RangeBucketAnalysis& a);
void WritePaceByGradientCsv(const std::string& path, const std::vector<stats::PaceByGradientEntry>& chart);
void WriteGradeAdjustmentCsv(const std::string& path, const stats::GradeAdjustmentAnalysis& a);
void WriteAdjustmentViewCsv(const std::string& path, const stats::AdjustmentView& v);

// Creates `dir` when missing and writes all five files.
void WriteReports(const std::string& dir,
                  const std::vector<RunResult>& runs,
                  const stats::GradientPaceReport& report);

} // namespace gradepace::io
