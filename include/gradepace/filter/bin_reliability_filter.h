#pragma once
/**
 * @file bin_reliability_filter.h
 * @brief Removal of physically implausible bins and bins outside a heart-rate window.
 *
 * Checks run in a fixed order and the first failing check names the exclusion:
 *   speed -> gradient -> duration -> distance -> heart rate.
 * Each excluded bin is counted under exactly one reason (plus the total).
 */

#include "gradepace/common/bin_types.h"
#include "gradepace/common/run_result.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace gradepace::filter {

struct ReliabilityThresholds {
  double min_speed_kmh = 1.0;
  double max_speed_kmh = 30.0;
  double max_abs_gradient_pct = 30.0;
  double min_duration_s = 1.0;
};

// Either bound may be absent; the window is active when at least one bound is set.
struct HeartRateRange {
  std::optional<int> min_bpm;
  std::optional<int> max_bpm;

  bool active() const { return min_bpm.has_value() || max_bpm.has_value(); }
};

struct FilterOptions {
  bool check_physical_plausibility = false;
  std::optional<HeartRateRange> heart_rate;
  ReliabilityThresholds thresholds{};
};

enum class ExclusionReason {
  None,
  Speed,
  Gradient,
  Duration,
  Distance,
  HeartRate
};

const char* ExclusionReasonText(ExclusionReason r);

struct ExclusionCounts {
  std::size_t speed = 0;
  std::size_t gradient = 0;
  std::size_t duration = 0;
  std::size_t distance = 0;
  std::size_t heart_rate = 0;
  std::size_t total = 0;

  void Add(ExclusionReason r);
  ExclusionCounts& operator+=(const ExclusionCounts& o);
};

struct FilterResult {
  std::vector<Bin> kept;
  ExclusionCounts counts{};
};

struct RunSetFilterResult {
  std::vector<RunResult> runs;        // same runs, bins replaced by the kept bins
  ExclusionCounts counts{};
  std::size_t original_bins = 0;
  std::size_t filtered_bins = 0;
};

// Speed used by the plausibility check: device speed when recorded, else velocity * 3.6, else 0.
double BinSpeedKmh(const Bin& b);

ExclusionReason ClassifyBin(const Bin& b, const FilterOptions& opts);

FilterResult FilterBins(const std::vector<Bin>& bins, const FilterOptions& opts);

RunSetFilterResult FilterRuns(const std::vector<RunResult>& runs, const FilterOptions& opts);

} // namespace gradepace::filter
