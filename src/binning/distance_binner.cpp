#include "gradepace/binning/distance_binner.h"

#include "gradepace/common/geo_utilities/geodesy.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace gradepace::binning {
namespace {

void derive_timing(const Point& start, const Point& end, Bin& b) {
  if (!start.time_s || !end.time_s) return;

  const double seconds = *end.time_s - *start.time_s;
  if (!std::isfinite(seconds) || seconds <= 0.0) return;

  b.duration_s = seconds;
  const double v = b.distance_m / seconds;
  if (!std::isfinite(v)) return;
  b.velocity_mps = v;
  if (v > 0.0) {
    b.pace_min_per_km = (1000.0 / v) / 60.0;
  }
}

void derive_grade_adjustment(const BinningOptions& opts, Bin& b) {
  if (!opts.grade_model || !opts.reference_velocity_mps) return;

  const double v_ref = *opts.reference_velocity_mps;
  if (!std::isfinite(v_ref) || v_ref <= 0.0) return;

  const double factor = opts.grade_model->Factor(grade::ClampGradient(b.gradient_pct));
  if (!std::isfinite(factor) || factor <= 0.0) return;

  b.adjusted_duration_s = (b.distance_m * factor) / v_ref;
  b.grade_adjusted_distance_m = b.distance_m * factor;
}

void aggregate_samples(const PointSequence& points, Bin& b) {
  long hr_sum = 0;
  int hr_max = 0;
  int hr_min = 0;
  std::size_t hr_n = 0;

  double speed_sum = 0.0;
  std::size_t speed_n = 0;

  for (std::size_t j = b.start_index; j <= b.end_index; ++j) {
    const Point& p = points[j];
    if (p.heart_rate_bpm && *p.heart_rate_bpm > 0) {
      const int hr = *p.heart_rate_bpm;
      if (hr_n == 0) {
        hr_max = hr;
        hr_min = hr;
      } else {
        hr_max = std::max(hr_max, hr);
        hr_min = std::min(hr_min, hr);
      }
      hr_sum += hr;
      ++hr_n;
    }
    if (p.speed_mps && std::isfinite(*p.speed_mps)) {
      speed_sum += *p.speed_mps;
      ++speed_n;
    }
  }

  b.heart_rate_samples = hr_n;
  if (hr_n > 0) {
    b.avg_heart_rate_bpm = static_cast<int>(std::floor(
        static_cast<double>(hr_sum) / static_cast<double>(hr_n) + 0.5));
    b.max_heart_rate_bpm = hr_max;
    b.min_heart_rate_bpm = hr_min;
  }
  if (speed_n > 0) {
    b.avg_speed_kmh = (speed_sum / static_cast<double>(speed_n)) * 3.6;
  }
}

Bin make_bin(const PointSequence& points,
             std::size_t start_idx,
             std::size_t end_idx,
             double distance_m,
             const BinningOptions& opts) {
  const Point& start = points[start_idx];
  const Point& end = points[end_idx];

  Bin b;
  b.start_index = start_idx;
  b.end_index = end_idx;
  b.distance_m = distance_m;
  b.elevation_change_m = end.elevation_m - start.elevation_m;
  b.gradient_pct = (distance_m > 0.0) ? (b.elevation_change_m / distance_m) * 100.0 : 0.0;
  if (!std::isfinite(b.gradient_pct)) b.gradient_pct = 0.0;
  b.start_time_s = start.time_s;
  b.end_time_s = end.time_s;

  derive_timing(start, end, b);
  derive_grade_adjustment(opts, b);
  aggregate_samples(points, b);
  return b;
}

} // namespace

std::vector<Bin> BuildBins(const PointSequence& points, const BinningOptions& opts) {
  if (!std::isfinite(opts.bin_length_m) || opts.bin_length_m <= 0.0) {
    throw std::invalid_argument("BuildBins: bin length must be > 0 (got " +
                                std::to_string(opts.bin_length_m) + ")");
  }

  std::vector<Bin> bins;
  if (points.size() < 2) return bins;

  std::size_t bin_start = 0;
  double cum_m = 0.0;

  for (std::size_t i = 1; i < points.size(); ++i) {
    cum_m += geo::SegmentDistanceM(points[i - 1], points[i]);

    if (cum_m >= opts.bin_length_m) {
      bins.push_back(make_bin(points, bin_start, i, cum_m, opts));
      bin_start = i;
      cum_m = 0.0;
    }
  }

  // Emitted even when cum_m == 0 so the ranges always reach the last point.
  const std::size_t last = points.size() - 1;
  if (bin_start < last) {
    bins.push_back(make_bin(points, bin_start, last, cum_m, opts));
  }

  return bins;
}

} // namespace gradepace::binning
