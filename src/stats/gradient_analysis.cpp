#include "gradepace/stats/gradient_analysis.h"

#include "gradepace/stats/grade_model_fit.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>

namespace gradepace::stats {
namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

struct RangeDef {
  double lower;
  double upper;
  const char* label;
};

// (lower, upper]; first and last ranges are open-ended.
constexpr std::array<RangeDef, 12> kRanges = {{
  {-kInf, -25.0, "<=-25%"},
  {-25.0, -20.0, "-25 to -20%"},
  {-20.0, -15.0, "-20 to -15%"},
  {-15.0, -10.0, "-15 to -10%"},
  {-10.0,  -5.0, "-10 to -5%"},
  { -5.0,   0.0, "-5 to 0%"},
  {  0.0,   5.0, "0 to 5%"},
  {  5.0,  10.0, "5 to 10%"},
  { 10.0,  15.0, "10 to 15%"},
  { 15.0,  20.0, "15 to 20%"},
  { 20.0,  25.0, "20 to 25%"},
  { 25.0,  kInf, ">25%"},
}};

template <typename Fn>
void for_each_bin(const std::vector<RunResult>& runs, Fn&& fn) {
  for (const RunResult& run : runs) {
    for (const Bin& b : run.bins) fn(b);
  }
}

// Flat reference among key-sorted exact groups: exact 0, else the nearest exact key
// within +/-2 (the lower one on ties). Returns nullptr when none qualifies.
template <typename Entry>
const Entry* find_flat_entry(const std::vector<Entry>& sorted) {
  const Entry* best = nullptr;
  for (const Entry& e : sorted) {
    if (!e.key.is_exact()) continue;
    const int g = e.key.value();
    if (g < -2 || g > 2) continue;
    if (!best || std::abs(g) < std::abs(best->key.value())) best = &e;
  }
  return best;
}

} // namespace

double KeyGradientValue(const GradientKey& key) {
  return static_cast<double>(key.value());
}

// ------------------------------
// Range buckets
// ------------------------------
std::size_t RangeBucketIndex(double gradient_pct) {
  if (gradient_pct <= kRanges.front().upper) return 0;
  for (std::size_t i = 1; i + 1 < kRanges.size(); ++i) {
    if (gradient_pct > kRanges[i].lower && gradient_pct <= kRanges[i].upper) return i;
  }
  return kRanges.size() - 1;
}

RangeBucketAnalysis AnalyzeRangeBuckets(const std::vector<RunResult>& runs) {
  RangeBucketAnalysis out;

  std::array<std::size_t, kRanges.size()> counts{};
  std::array<std::vector<double>, kRanges.size()> paces;
  std::array<std::vector<double>, kRanges.size()> hrs;

  for_each_bin(runs, [&](const Bin& b) {
    ++out.total_bins;
    if (std::isnan(b.gradient_pct)) return;
    const std::size_t k = RangeBucketIndex(b.gradient_pct);
    ++counts[k];
    if (b.pace_min_per_km && IsPositiveFinite(*b.pace_min_per_km)) {
      paces[k].push_back(*b.pace_min_per_km);
    }
    if (b.avg_heart_rate_bpm && *b.avg_heart_rate_bpm > 0) {
      hrs[k].push_back(static_cast<double>(*b.avg_heart_rate_bpm));
    }
  });

  for (std::size_t k = 0; k < kRanges.size(); ++k) {
    if (paces[k].empty()) continue;

    RangeBucket rb;
    rb.label = kRanges[k].label;
    rb.lower = kRanges[k].lower;
    rb.upper = kRanges[k].upper;
    rb.bin_count = counts[k];
    rb.pace_samples = paces[k].size();
    rb.mean_pace = Mean(paces[k]);
    rb.median_pace = Median(paces[k]);
    if (!hrs[k].empty()) {
      rb.mean_heart_rate = Mean(hrs[k]);
      rb.median_heart_rate = Median(hrs[k]);
    }
    out.buckets.push_back(rb);
  }
  return out;
}

// ------------------------------
// Per-degree chart
// ------------------------------
std::vector<PaceByGradientEntry> PaceByGradientChart(const std::vector<RunResult>& runs) {
  std::map<GradientKey, PaceByGradientEntry> groups;

  for_each_bin(runs, [&](const Bin& b) {
    if (!std::isfinite(b.gradient_pct)) return;
    if (!(b.distance_m > 0.0) || !b.duration_s || !(*b.duration_s > 0.0)) return;

    const GradientKey key = GradientKey::FromGradient(b.gradient_pct);
    auto [it, inserted] = groups.try_emplace(key, PaceByGradientEntry{});
    if (inserted) it->second.key = key;
    it->second.total_distance_m += b.distance_m;
    it->second.total_time_s += *b.duration_s;
    ++it->second.bin_count;
  });

  std::vector<PaceByGradientEntry> out;
  out.reserve(groups.size());
  for (auto& kv : groups) {
    PaceByGradientEntry& e = kv.second;
    e.pace_min_per_km = (e.total_time_s / 60.0) / (e.total_distance_m / 1000.0);
    out.push_back(e);
  }
  return out;
}

// ------------------------------
// Grade adjustment
// ------------------------------
GradeAdjustmentAnalysis AnalyzeGradeAdjustment(const std::vector<PaceByGradientEntry>& chart,
                                               const grade::IGradeModel& literature) {
  GradeAdjustmentAnalysis out;
  if (chart.empty()) return out;

  if (const PaceByGradientEntry* flat = find_flat_entry(chart)) {
    out.base_pace = flat->pace_min_per_km;
  } else {
    std::vector<double> paces;
    paces.reserve(chart.size());
    for (const auto& e : chart) {
      if (IsPositiveFinite(e.pace_min_per_km)) paces.push_back(e.pace_min_per_km);
    }
    if (!paces.empty()) out.base_pace = Mean(paces);
  }

  const double base = out.base_pace.value_or(0.0);
  out.entries.reserve(chart.size());
  for (const auto& e : chart) {
    GradeAdjustmentEntry g;
    g.key = e.key;
    g.gradient_value = KeyGradientValue(e.key);
    g.pace_min_per_km = e.pace_min_per_km;
    g.personal_factor = (base > 0.0) ? e.pace_min_per_km / base : 1.0;
    g.literature_factor = literature.Factor(g.gradient_value);
    g.bin_count = e.bin_count;
    out.entries.push_back(g);
  }
  return out;
}

GradeAdjustmentAnalysis AnalyzeGradeAdjustment(const std::vector<RunResult>& runs) {
  const grade::QuarticGradeModel literature;
  return AnalyzeGradeAdjustment(PaceByGradientChart(runs), literature);
}

// ------------------------------
// Per-bin adjustment vs expectation
// ------------------------------
AdjustmentView BuildAdjustmentView(const std::vector<RunResult>& runs,
                                   Statistic statistic,
                                   const grade::IGradeModel& model) {
  struct Group {
    GradientKey key;
    std::vector<double> paces;
  };

  AdjustmentView out;
  out.statistic = statistic;

  std::map<GradientKey, Group> groups;
  std::vector<double> all_paces;

  for_each_bin(runs, [&](const Bin& b) {
    if (!std::isfinite(b.gradient_pct)) return;
    if (!b.pace_min_per_km || !IsPositiveFinite(*b.pace_min_per_km)) return;

    const GradientKey key = GradientKey::FromGradient(b.gradient_pct);
    auto [it, inserted] = groups.try_emplace(key, Group{});
    if (inserted) it->second.key = key;
    it->second.paces.push_back(*b.pace_min_per_km);
    all_paces.push_back(*b.pace_min_per_km);
  });

  if (groups.empty()) return out;

  std::vector<Group> sorted;
  sorted.reserve(groups.size());
  for (auto& kv : groups) sorted.push_back(std::move(kv.second));

  if (const Group* flat = find_flat_entry(sorted)) {
    out.base_pace = Compute(statistic, flat->paces);
  } else {
    out.base_pace = Compute(statistic, all_paces);
  }

  const double base = *out.base_pace;
  if (!IsPositiveFinite(base)) {
    out.base_pace.reset();
    return out;
  }

  out.entries.reserve(sorted.size());
  for (const Group& g : sorted) {
    std::vector<double> ratios;
    ratios.reserve(g.paces.size());
    for (double p : g.paces) ratios.push_back(p / base);

    AdjustmentViewEntry e;
    e.key = g.key;
    e.bin_count = g.paces.size();
    e.actual_ratio = Compute(statistic, ratios);
    e.expected_ratio = model.Factor(KeyGradientValue(g.key));
    e.deviation = e.actual_ratio - e.expected_ratio;
    out.entries.push_back(e);
  }
  return out;
}

// ------------------------------
// Combined report
// ------------------------------
GradientPaceReport AnalyzeGradientPace(const std::vector<RunResult>& runs,
                                       const GradientPaceOptions& opts) {
  const grade::QuarticGradeModel literature;

  GradientPaceReport r;
  r.range_buckets = AnalyzeRangeBuckets(runs);
  r.per_degree = PaceByGradientChart(runs);
  r.grade_adjustment = AnalyzeGradeAdjustment(r.per_degree, literature);
  r.adjustment_view = BuildAdjustmentView(runs, opts.view_statistic, literature);
  if (opts.fit_personal_model) {
    r.personal_model = FitPersonalGradeModel(r.grade_adjustment.entries);
  }
  return r;
}

} // namespace gradepace::stats
