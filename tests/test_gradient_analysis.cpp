#undef NDEBUG
#include <cassert>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <vector>

#include "gradepace/plugins/grade/grade_model.h"
#include "gradepace/stats/gradient_analysis.h"
#include "gradepace/stats/gradient_key.h"
#include "gradepace/stats/statistics.h"

using namespace gradepace;
using namespace gradepace::stats;

static bool near(double a, double b, double tol) { return std::fabs(a - b) <= tol; }

static Bin timed_bin(double gradient_pct, double distance_m, double duration_s) {
  Bin b;
  b.gradient_pct = gradient_pct;
  b.distance_m = distance_m;
  b.duration_s = duration_s;
  b.velocity_mps = distance_m / duration_s;
  b.pace_min_per_km = (duration_s / 60.0) / (distance_m / 1000.0);
  return b;
}

// A bin whose pace is `pace` min/km over 100 m.
static Bin paced_bin(double gradient_pct, double pace) {
  return timed_bin(gradient_pct, 100.0, pace * 6.0);
}

static std::vector<RunResult> one_run(const std::vector<Bin>& bins) {
  RunResult r;
  r.bins = bins;
  return {r};
}

void test_statistics() {
  assert(Mean({4.0}) == 4.0);
  assert(Median({4.0}) == 4.0);
  assert(Mean({1.0, 2.0, 6.0}) == 3.0);
  assert(Median({6.0, 1.0, 2.0}) == 2.0);
  assert(Median({4.0, 1.0, 3.0, 2.0}) == 2.5);
  assert(StatisticFromText("median") == Statistic::Median);
  bool threw = false;
  try {
    StatisticFromText("mode");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  printf("PASS: test_statistics\n");
}

void test_gradient_key() {
  assert(GradientKey::FromGradient(2.5) == GradientKey::Exact(3));
  assert(GradientKey::FromGradient(-0.5) == GradientKey::Exact(0));
  assert(GradientKey::FromGradient(-1.5) == GradientKey::Exact(-1));
  assert(GradientKey::FromGradient(34.4) == GradientKey::Exact(34));
  assert(GradientKey::FromGradient(34.5) == GradientKey::AtLeast());
  assert(GradientKey::FromGradient(-34.6) == GradientKey::AtMost());
  assert(GradientKey::FromGradient(-80.0) == GradientKey::AtMost());

  assert(GradientKey::AtMost() < GradientKey::Exact(-34));
  assert(GradientKey::Exact(-34) < GradientKey::Exact(34));
  assert(GradientKey::Exact(34) < GradientKey::AtLeast());

  assert(GradientKey::AtMost().Label() == "<=-35");
  assert(GradientKey::AtLeast().Label() == ">=35");
  assert(GradientKey::Exact(-4).Label() == "-4");
  printf("PASS: test_gradient_key\n");
}

void test_range_bucket_index() {
  assert(RangeBucketIndex(-30.0) == 0);
  assert(RangeBucketIndex(-25.0) == 0);
  assert(RangeBucketIndex(-24.9) == 1);
  assert(RangeBucketIndex(0.0) == 5);
  assert(RangeBucketIndex(0.1) == 6);
  assert(RangeBucketIndex(25.0) == 10);
  assert(RangeBucketIndex(25.1) == 11);
  assert(RangeBucketIndex(90.0) == 11);
  printf("PASS: test_range_bucket_index\n");
}

void test_range_buckets() {
  std::vector<Bin> bins = {
    paced_bin(1.0, 5.0),
    paced_bin(2.0, 6.0),
    paced_bin(3.0, 10.0),
    paced_bin(-12.0, 4.0),
  };
  Bin unpaced;
  unpaced.gradient_pct = 4.0;
  bins.push_back(unpaced);
  Bin unpaced_only;
  unpaced_only.gradient_pct = 22.0;
  bins.push_back(unpaced_only);
  bins[0].avg_heart_rate_bpm = 150;

  const RangeBucketAnalysis a = AnalyzeRangeBuckets(one_run(bins));
  assert(a.total_bins == 6);
  // "20 to 25%" holds no pace and is left out.
  assert(a.buckets.size() == 2);

  const RangeBucket& down = a.buckets[0];
  assert(down.label == "-15 to -10%");
  assert(down.bin_count == 1);
  assert(down.mean_pace == down.median_pace);
  assert(near(down.mean_pace, 4.0, 1e-9));
  assert(!down.mean_heart_rate);

  const RangeBucket& up = a.buckets[1];
  assert(up.label == "0 to 5%");
  assert(up.bin_count == 4);
  assert(up.pace_samples == 3);
  assert(near(up.mean_pace, 7.0, 1e-9));
  assert(near(up.median_pace, 6.0, 1e-9));
  assert(up.mean_heart_rate && *up.mean_heart_rate == 150.0);
  printf("PASS: test_range_buckets\n");
}

void test_per_degree_chart_is_weighted() {
  // 100 m in 30 s (5:00/km) and 50 m in 30 s (10:00/km) on the same degree.
  const std::vector<Bin> bins = {
    timed_bin(3.2, 100.0, 30.0),
    timed_bin(2.8, 50.0, 30.0),
    timed_bin(-40.0, 50.0, 30.0),
    timed_bin(36.0, 50.0, 60.0),
  };
  const std::vector<PaceByGradientEntry> chart = PaceByGradientChart(one_run(bins));
  assert(chart.size() == 3);
  assert(chart[0].key == GradientKey::AtMost());
  assert(chart[1].key == GradientKey::Exact(3));
  assert(chart[2].key == GradientKey::AtLeast());

  assert(chart[1].bin_count == 2);
  assert(near(chart[1].total_distance_m, 150.0, 1e-9));
  assert(near(chart[1].total_time_s, 60.0, 1e-9));
  // Weighted: 1 min over 0.15 km, not the 7.5 mean of the two paces.
  assert(near(chart[1].pace_min_per_km, 1.0 / 0.15, 1e-9));

  // Bins without a duration or distance are ignored.
  Bin untimed;
  untimed.gradient_pct = 1.0;
  untimed.distance_m = 50.0;
  assert(PaceByGradientChart(one_run({untimed})).empty());
  printf("PASS: test_per_degree_chart_is_weighted\n");
}

void test_grade_adjustment_base() {
  grade::QuarticGradeModel literature;

  // Exact 0 present.
  {
    const auto a = AnalyzeGradeAdjustment(one_run({paced_bin(0.2, 6.0), paced_bin(8.0, 9.0)}));
    assert(a.base_pace && near(*a.base_pace, 6.0, 1e-9));
    assert(a.entries.size() == 2);
    assert(near(a.entries[1].personal_factor, 1.5, 1e-9));
    assert(near(a.entries[1].literature_factor, literature.Factor(8.0), 1e-12));
    assert(a.entries[1].gradient_value == 8.0);
  }
  // No 0: nearest within +/-2, lower gradient on ties.
  {
    const auto a = AnalyzeGradeAdjustment(one_run({
      paced_bin(-1.0, 5.0), paced_bin(1.0, 7.0), paced_bin(5.0, 10.0)}));
    assert(a.base_pace && near(*a.base_pace, 5.0, 1e-9));
    assert(near(a.entries[2].personal_factor, 2.0, 1e-9));
  }
  // Nothing within +/-2: mean of group paces.
  {
    const auto a = AnalyzeGradeAdjustment(one_run({paced_bin(-6.0, 4.0), paced_bin(6.0, 8.0)}));
    assert(a.base_pace && near(*a.base_pace, 6.0, 1e-9));
    assert(near(a.entries[0].personal_factor, 4.0 / 6.0, 1e-9));
  }
  // Folded extremes report -35 / 35.
  {
    const auto a = AnalyzeGradeAdjustment(one_run({paced_bin(0.0, 6.0), paced_bin(50.0, 20.0)}));
    assert(a.entries.back().key == GradientKey::AtLeast());
    assert(a.entries.back().gradient_value == 35.0);
    assert(near(a.entries.back().literature_factor, literature.Factor(35.0), 1e-12));
  }
  // Empty input.
  {
    const auto a = AnalyzeGradeAdjustment(std::vector<RunResult>{});
    assert(!a.base_pace);
    assert(a.entries.empty());
  }
  printf("PASS: test_grade_adjustment_base\n");
}

void test_adjustment_view() {
  grade::QuarticGradeModel model;
  const std::vector<RunResult> runs = one_run({
    paced_bin(0.0, 5.0), paced_bin(0.3, 6.0), paced_bin(-0.4, 10.0),
    paced_bin(10.0, 8.0), paced_bin(10.2, 9.0)});

  const AdjustmentView mean_view = BuildAdjustmentView(runs, Statistic::Mean, model);
  assert(mean_view.base_pace && near(*mean_view.base_pace, 7.0, 1e-9));
  assert(mean_view.entries.size() == 2);
  const AdjustmentViewEntry& up = mean_view.entries[1];
  assert(up.key == GradientKey::Exact(10));
  assert(up.bin_count == 2);
  assert(near(up.actual_ratio, 8.5 / 7.0, 1e-9));
  assert(near(up.expected_ratio, model.Factor(10.0), 1e-12));
  assert(near(up.deviation, up.actual_ratio - up.expected_ratio, 1e-12));

  const AdjustmentView median_view = BuildAdjustmentView(runs, Statistic::Median, model);
  assert(median_view.base_pace && near(*median_view.base_pace, 6.0, 1e-9));
  assert(near(median_view.entries[0].actual_ratio, 1.0, 1e-9));
  assert(near(median_view.entries[1].actual_ratio, 8.5 / 6.0, 1e-9));

  assert(BuildAdjustmentView({}, Statistic::Mean, model).entries.empty());
  printf("PASS: test_adjustment_view\n");
}

void test_combined_report() {
  std::vector<Bin> bins;
  for (int g = -6; g <= 6; ++g) {
    const double pace = 6.0 * grade::QuarticGradeModel().Factor(g);
    bins.push_back(paced_bin(g, pace));
    bins.push_back(paced_bin(g, pace));
  }
  const GradientPaceReport r = AnalyzeGradientPace(one_run(bins));
  assert(r.range_buckets.total_bins == bins.size());
  assert(r.per_degree.size() == 13);
  assert(r.grade_adjustment.base_pace && near(*r.grade_adjustment.base_pace, 6.0, 1e-9));
  assert(r.adjustment_view.entries.size() == 13);
  assert(r.personal_model);

  GradientPaceOptions opts;
  opts.fit_personal_model = false;
  assert(!AnalyzeGradientPace(one_run(bins), opts).personal_model);

  const GradientPaceReport empty = AnalyzeGradientPace({});
  assert(empty.range_buckets.buckets.empty());
  assert(empty.per_degree.empty());
  assert(!empty.grade_adjustment.base_pace);
  assert(!empty.personal_model);
  printf("PASS: test_combined_report\n");
}

int main() {
  test_statistics();
  test_gradient_key();
  test_range_bucket_index();
  test_range_buckets();
  test_per_degree_chart_is_weighted();
  test_grade_adjustment_base();
  test_adjustment_view();
  test_combined_report();
  printf("All gradient analysis tests passed.\n");
  return 0;
}
