#include "gradepace/filter/bin_reliability_filter.h"

#include <cmath>
#include <utility>

namespace gradepace::filter {

const char* ExclusionReasonText(ExclusionReason r) {
  switch (r) {
    case ExclusionReason::Speed:     return "speed";
    case ExclusionReason::Gradient:  return "gradient";
    case ExclusionReason::Duration:  return "duration";
    case ExclusionReason::Distance:  return "distance";
    case ExclusionReason::HeartRate: return "heartRate";
    case ExclusionReason::None:      break;
  }
  return "none";
}

void ExclusionCounts::Add(ExclusionReason r) {
  switch (r) {
    case ExclusionReason::Speed:     ++speed; break;
    case ExclusionReason::Gradient:  ++gradient; break;
    case ExclusionReason::Duration:  ++duration; break;
    case ExclusionReason::Distance:  ++distance; break;
    case ExclusionReason::HeartRate: ++heart_rate; break;
    case ExclusionReason::None:      return;
  }
  ++total;
}

ExclusionCounts& ExclusionCounts::operator+=(const ExclusionCounts& o) {
  speed += o.speed;
  gradient += o.gradient;
  duration += o.duration;
  distance += o.distance;
  heart_rate += o.heart_rate;
  total += o.total;
  return *this;
}

double BinSpeedKmh(const Bin& b) {
  if (b.avg_speed_kmh && std::isfinite(*b.avg_speed_kmh)) return *b.avg_speed_kmh;
  if (b.velocity_mps && std::isfinite(*b.velocity_mps)) return *b.velocity_mps * 3.6;
  return 0.0;
}

ExclusionReason ClassifyBin(const Bin& b, const FilterOptions& opts) {
  if (opts.check_physical_plausibility) {
    const ReliabilityThresholds& th = opts.thresholds;

    // Negated comparisons so NaN fails the check.
    const double speed = BinSpeedKmh(b);
    if (!(speed >= th.min_speed_kmh && speed <= th.max_speed_kmh)) {
      return ExclusionReason::Speed;
    }
    if (!(b.gradient_pct >= -th.max_abs_gradient_pct && b.gradient_pct <= th.max_abs_gradient_pct)) {
      return ExclusionReason::Gradient;
    }
    if (!(b.duration_s && *b.duration_s >= th.min_duration_s)) {
      return ExclusionReason::Duration;
    }
    if (!(b.distance_m > 0.0)) {
      return ExclusionReason::Distance;
    }
  }

  if (opts.heart_rate && opts.heart_rate->active()) {
    const HeartRateRange& hr = *opts.heart_rate;
    if (!b.avg_heart_rate_bpm ||
        (hr.min_bpm && *b.avg_heart_rate_bpm < *hr.min_bpm) ||
        (hr.max_bpm && *b.avg_heart_rate_bpm > *hr.max_bpm)) {
      return ExclusionReason::HeartRate;
    }
  }

  return ExclusionReason::None;
}

FilterResult FilterBins(const std::vector<Bin>& bins, const FilterOptions& opts) {
  FilterResult out;
  out.kept.reserve(bins.size());
  for (const Bin& b : bins) {
    const ExclusionReason r = ClassifyBin(b, opts);
    if (r == ExclusionReason::None) {
      out.kept.push_back(b);
    } else {
      out.counts.Add(r);
    }
  }
  return out;
}

RunSetFilterResult FilterRuns(const std::vector<RunResult>& runs, const FilterOptions& opts) {
  RunSetFilterResult out;
  out.runs.reserve(runs.size());
  for (const RunResult& run : runs) {
    out.original_bins += run.bins.size();

    FilterResult fr = FilterBins(run.bins, opts);
    out.counts += fr.counts;
    out.filtered_bins += fr.kept.size();

    RunResult filtered = run;
    filtered.bins = std::move(fr.kept);
    out.runs.push_back(std::move(filtered));
  }
  return out;
}

} // namespace gradepace::filter
