#include "gradepace/binning/run_summary.h"

#include <algorithm>
#include <cmath>

namespace gradepace::binning {

std::optional<RunSummary> Summarize(const std::vector<Bin>& bins) {
  if (bins.empty()) return std::nullopt;

  RunSummary s;
  s.total_bins = bins.size();

  double dist_m = 0.0;
  double gain_m = 0.0;
  long hr_sum = 0;
  std::size_t hr_bins = 0;
  int hr_max = 0;

  for (const Bin& b : bins) {
    if (!(b.distance_m > 0.0)) continue;
    ++s.valid_bins;

    dist_m += b.distance_m;
    if (b.duration_s) s.total_time_s += *b.duration_s;
    gain_m += std::max(0.0, b.elevation_change_m);

    if (b.avg_heart_rate_bpm) {
      hr_sum += *b.avg_heart_rate_bpm;
      if (b.max_heart_rate_bpm) hr_max = std::max(hr_max, *b.max_heart_rate_bpm);
      ++hr_bins;
    }
  }

  if (s.valid_bins == 0) return std::nullopt;

  s.total_distance_km = dist_m / 1000.0;
  s.total_elevation_gain_m = std::floor(gain_m + 0.5);

  if (dist_m > 0.0 && s.total_time_s > 0.0) {
    s.avg_pace_min_per_km = (s.total_time_s / 60.0) / (dist_m / 1000.0);
  }

  if (hr_bins > 0) {
    s.avg_heart_rate_bpm = static_cast<int>(std::floor(
        static_cast<double>(hr_sum) / static_cast<double>(hr_bins) + 0.5));
    s.max_heart_rate_bpm = hr_max;
  }
  s.heart_rate_coverage = static_cast<double>(hr_bins) / static_cast<double>(s.valid_bins);

  return s;
}

bool HasHeartRateData(const std::vector<Bin>& bins) {
  return std::any_of(bins.begin(), bins.end(),
                     [](const Bin& b) { return b.avg_heart_rate_bpm.has_value(); });
}

} // namespace gradepace::binning
