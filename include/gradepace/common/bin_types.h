#pragma once
/**
 * @file bin_types.h
 * @brief Distance bins and the per-run summary derived from them.
 */

#include <cstddef>
#include <optional>

namespace gradepace {

struct Bin {
  double distance_m = 0.0;
  double elevation_change_m = 0.0;
  double gradient_pct = 0.0;

  std::optional<double> duration_s;
  std::optional<double> velocity_mps;
  std::optional<double> pace_min_per_km;

  double adjusted_duration_s = 0.0;                  // 0 when not computable
  std::optional<double> grade_adjusted_distance_m;

  std::size_t start_index = 0;                       // inclusive
  std::size_t end_index = 0;                         // inclusive
  std::optional<double> start_time_s;
  std::optional<double> end_time_s;

  std::optional<int> avg_heart_rate_bpm;
  std::optional<int> max_heart_rate_bpm;
  std::optional<int> min_heart_rate_bpm;
  std::size_t heart_rate_samples = 0;

  // Mean of device speed samples inside the bin (km/h), when the source recorded speed.
  std::optional<double> avg_speed_kmh;
};

struct RunSummary {
  std::size_t total_bins = 0;
  std::size_t valid_bins = 0;
  double total_distance_km = 0.0;
  double total_time_s = 0.0;
  double total_elevation_gain_m = 0.0;
  std::optional<double> avg_pace_min_per_km;
  std::optional<int> avg_heart_rate_bpm;
  std::optional<int> max_heart_rate_bpm;
  double heart_rate_coverage = 0.0;                  // bins with HR / valid bins
};

} // namespace gradepace
