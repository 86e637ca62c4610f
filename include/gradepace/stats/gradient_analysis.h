#pragma once
/**
 * @file gradient_analysis.h
 * @brief Cross-run pace vs gradient statistics.
 *
 * Three aggregations are provided and intentionally differ:
 *  - Range buckets: 12 fixed gradient ranges; mean and median of per-bin paces.
 *  - Per-degree chart: integer-degree groups; one distance/time weighted pace per group.
 *  - Grade adjustment: per-degree paces relative to a flat baseline, next to the literature curve.
 * A fourth view compares per-bin pace ratios with the model expectation (mean or median).
 */

#include "gradepace/common/bin_types.h"
#include "gradepace/common/run_result.h"
#include "gradepace/plugins/grade/grade_model.h"
#include "gradepace/stats/gradient_key.h"
#include "gradepace/stats/statistics.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gradepace::stats {

// ------------------------------
// Range buckets
// ------------------------------
struct RangeBucket {
  std::string label;
  double lower = 0.0;                 // exclusive (-inf for the first bucket)
  double upper = 0.0;                 // inclusive (+inf for the last bucket)
  std::size_t bin_count = 0;          // every bin inside the range
  std::size_t pace_samples = 0;
  double mean_pace = 0.0;             // min/km
  double median_pace = 0.0;
  std::optional<double> mean_heart_rate;
  std::optional<double> median_heart_rate;
};

struct RangeBucketAnalysis {
  std::vector<RangeBucket> buckets;   // only ranges holding at least one valid pace
  std::size_t total_bins = 0;
};

// Index of the fixed range holding the gradient: 0 for <= -25 ... 11 for > 25.
std::size_t RangeBucketIndex(double gradient_pct);

RangeBucketAnalysis AnalyzeRangeBuckets(const std::vector<RunResult>& runs);

// ------------------------------
// Per-degree chart
// ------------------------------
struct PaceByGradientEntry {
  GradientKey key;
  std::size_t bin_count = 0;
  double total_distance_m = 0.0;
  double total_time_s = 0.0;
  double pace_min_per_km = 0.0;       // (total_time/60) / (total_distance/1000)
};

std::vector<PaceByGradientEntry> PaceByGradientChart(const std::vector<RunResult>& runs);

// ------------------------------
// Grade adjustment
// ------------------------------
struct GradeAdjustmentEntry {
  GradientKey key;
  double gradient_value = 0.0;        // sentinels report -35 / 35
  double pace_min_per_km = 0.0;
  double personal_factor = 1.0;       // pace / base pace
  double literature_factor = 1.0;
  std::size_t bin_count = 0;
};

struct GradeAdjustmentAnalysis {
  std::optional<double> base_pace;
  std::vector<GradeAdjustmentEntry> entries;
};

// Base pace: exact 0, else the exact key within +/-2 closest to 0 (lower gradient on
// ties), else the mean of all group paces. Personal factors are 1 without a base pace.
GradeAdjustmentAnalysis AnalyzeGradeAdjustment(const std::vector<PaceByGradientEntry>& chart,
                                               const grade::IGradeModel& literature);

// Uses the literature quartic model.
GradeAdjustmentAnalysis AnalyzeGradeAdjustment(const std::vector<RunResult>& runs);

// ------------------------------
// Per-bin adjustment vs expectation
// ------------------------------
struct AdjustmentViewEntry {
  GradientKey key;
  std::size_t bin_count = 0;
  double actual_ratio = 1.0;          // statistic of (bin pace / base pace)
  double expected_ratio = 1.0;        // model factor at the key's gradient
  double deviation = 0.0;             // actual - expected
};

struct AdjustmentView {
  Statistic statistic = Statistic::Mean;
  std::optional<double> base_pace;
  std::vector<AdjustmentViewEntry> entries;
};

AdjustmentView BuildAdjustmentView(const std::vector<RunResult>& runs,
                                   Statistic statistic,
                                   const grade::IGradeModel& model);

// ------------------------------
// Combined report
// ------------------------------
struct GradientPaceOptions {
  Statistic view_statistic = Statistic::Mean;
  bool fit_personal_model = true;
};

struct GradientPaceReport {
  RangeBucketAnalysis range_buckets;
  std::vector<PaceByGradientEntry> per_degree;
  GradeAdjustmentAnalysis grade_adjustment;
  AdjustmentView adjustment_view;
  std::optional<grade::QuarticCoefficients> personal_model;
};

GradientPaceReport AnalyzeGradientPace(const std::vector<RunResult>& runs,
                                       const GradientPaceOptions& opts = GradientPaceOptions{});

// Gradient value a key stands for (-35 / 35 for the folded extremes).
double KeyGradientValue(const GradientKey& key);

} // namespace gradepace::stats
