#undef NDEBUG
#include <cassert>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

#include "gradepace/binning/distance_binner.h"
#include "gradepace/binning/run_summary.h"
#include "gradepace/common/geo_utilities/geodesy.h"
#include "gradepace/plugins/grade/grade_model.h"

using namespace gradepace;

static const double kPi = std::acos(-1.0);

static bool near(double a, double b, double tol) { return std::fabs(a - b) <= tol; }

// Points along the equator, `spacing_m` apart, climbing 1 m and 3 s per point.
static PointSequence equator_track(int n, double spacing_m) {
  const double deg_per_m = 180.0 / (kPi * geo::kEarthRadiusM);
  PointSequence pts;
  for (int i = 0; i < n; ++i) {
    Point p;
    p.lat = 0.0;
    p.lon = i * spacing_m * deg_per_m;
    p.elevation_m = 100.0 + i;
    p.time_s = 1700000000.0 + 3.0 * i;
    pts.push_back(p);
  }
  return pts;
}

void test_haversine() {
  const double one_degree = kPi * geo::kEarthRadiusM / 180.0;
  assert(near(geo::HaversineM(0.0, 0.0, 0.0, 1.0), one_degree, 1e-6));
  assert(geo::HaversineM(10.0, 10.0, 10.0, 10.0) == 0.0);

  const double nan = std::numeric_limits<double>::quiet_NaN();
  assert(geo::HaversineM(nan, 0.0, 0.0, 1.0) == 0.0);

  Point a;
  Point b;
  b.lon = nan;
  assert(geo::SegmentDistanceM(a, b) == 0.0);
  printf("PASS: test_haversine\n");
}

void test_track_totals() {
  PointSequence pts = equator_track(5, 10.0);
  assert(near(geo::PathLengthM(pts), 40.0, 1e-6));
  assert(near(geo::ElevationGainM(pts), 4.0, 1e-9));
  assert(near(geo::ElapsedTimeS(pts), 12.0, 1e-9));

  pts.back().time_s.reset();
  assert(geo::ElapsedTimeS(pts) == 0.0);

  pts[2].elevation_m = 90.0;   // dip then climb back: only positive deltas count
  assert(near(geo::ElevationGainM(pts), 1.0 + (103.0 - 90.0) + 1.0, 1e-9));
  printf("PASS: test_track_totals\n");
}

void test_bins_partition_track() {
  const PointSequence pts = equator_track(23, 10.1);
  const std::vector<Bin> bins = binning::BuildBins(pts, 50.0);

  // 4 full bins of 5 segments plus a 2-segment remainder.
  assert(bins.size() == 5);
  assert(bins.front().start_index == 0);
  assert(bins.back().end_index == pts.size() - 1);
  for (std::size_t i = 1; i < bins.size(); ++i) {
    assert(bins[i].start_index == bins[i - 1].end_index);
  }

  double total = 0.0;
  for (const Bin& b : bins) total += b.distance_m;
  assert(near(total, geo::PathLengthM(pts), 1e-6));

  for (std::size_t i = 0; i < 4; ++i) {
    assert(bins[i].distance_m >= 50.0);
    assert(near(bins[i].distance_m, 50.5, 1e-6));
  }
  assert(near(bins.back().distance_m, 20.2, 1e-6));
  printf("PASS: test_bins_partition_track\n");
}

void test_bin_metrics() {
  const PointSequence pts = equator_track(21, 10.1);
  const std::vector<Bin> bins = binning::BuildBins(pts, 50.0);
  assert(bins.size() == 4);

  const Bin& b = bins[0];
  assert(near(b.elevation_change_m, 5.0, 1e-9));
  assert(near(b.gradient_pct, 5.0 / 50.5 * 100.0, 1e-6));
  assert(b.duration_s && near(*b.duration_s, 15.0, 1e-9));
  assert(b.velocity_mps && near(*b.velocity_mps, 50.5 / 15.0, 1e-6));
  assert(b.pace_min_per_km && near(*b.pace_min_per_km, (1000.0 / (50.5 / 15.0)) / 60.0, 1e-6));
  assert(b.start_time_s && b.end_time_s);

  // No model configured: nothing to adjust.
  assert(b.adjusted_duration_s == 0.0);
  assert(!b.grade_adjusted_distance_m);

  // No heart-rate samples: no heart-rate fields.
  assert(!b.avg_heart_rate_bpm);
  assert(b.heart_rate_samples == 0);
  assert(!binning::HasHeartRateData(bins));
  printf("PASS: test_bin_metrics\n");
}

void test_bin_heart_rate() {
  PointSequence pts = equator_track(6, 10.1);
  pts[0].heart_rate_bpm = 140;
  pts[2].heart_rate_bpm = 150;
  pts[5].heart_rate_bpm = 151;
  pts[3].heart_rate_bpm = 0;     // invalid sample

  const std::vector<Bin> bins = binning::BuildBins(pts, 50.0);
  assert(bins.size() == 1);
  assert(bins[0].heart_rate_samples == 3);
  assert(bins[0].avg_heart_rate_bpm && *bins[0].avg_heart_rate_bpm == 147);
  assert(bins[0].max_heart_rate_bpm && *bins[0].max_heart_rate_bpm == 151);
  assert(bins[0].min_heart_rate_bpm && *bins[0].min_heart_rate_bpm == 140);
  assert(binning::HasHeartRateData(bins));
  printf("PASS: test_bin_heart_rate\n");
}

void test_zero_distance_bin() {
  Point a;
  a.lat = 45.0;
  a.lon = 7.0;
  a.elevation_m = 300.0;
  a.time_s = 0.0;
  Point b = a;
  b.elevation_m = 310.0;
  b.time_s = 10.0;

  const std::vector<Bin> bins = binning::BuildBins(PointSequence{a, b}, 50.0);
  assert(bins.size() == 1);
  assert(bins[0].distance_m == 0.0);
  assert(bins[0].gradient_pct == 0.0);
  assert(bins[0].elevation_change_m == 10.0);
  assert(!bins[0].pace_min_per_km);

  assert(!binning::Summarize(bins));
  printf("PASS: test_zero_distance_bin\n");
}

void test_adjusted_duration() {
  const PointSequence pts = equator_track(6, 10.1);
  grade::QuadraticGradeModel model;

  binning::BinningOptions opts;
  opts.bin_length_m = 50.0;
  opts.grade_model = &model;
  opts.reference_velocity_mps = 3.0;

  const std::vector<Bin> bins = binning::BuildBins(pts, opts);
  assert(bins.size() == 1);
  const double factor = model.Factor(bins[0].gradient_pct);
  assert(near(bins[0].adjusted_duration_s, bins[0].distance_m * factor / 3.0, 1e-9));
  assert(bins[0].grade_adjusted_distance_m);
  assert(near(*bins[0].grade_adjusted_distance_m, bins[0].distance_m * factor, 1e-9));

  opts.reference_velocity_mps = 0.0;
  assert(binning::BuildBins(pts, opts)[0].adjusted_duration_s == 0.0);
  printf("PASS: test_adjusted_duration\n");
}

void test_short_and_invalid_input() {
  assert(binning::BuildBins(PointSequence{}, 50.0).empty());
  assert(binning::BuildBins(equator_track(1, 10.0), 50.0).empty());

  bool threw = false;
  try {
    binning::BuildBins(equator_track(3, 10.0), 0.0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    binning::BuildBins(equator_track(3, 10.0), std::numeric_limits<double>::quiet_NaN());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  printf("PASS: test_short_and_invalid_input\n");
}

void test_run_summary() {
  PointSequence pts = equator_track(21, 10.1);
  pts[1].heart_rate_bpm = 150;
  const std::vector<Bin> bins = binning::BuildBins(pts, 50.0);

  const auto s = binning::Summarize(bins);
  assert(s);
  assert(s->total_bins == 4);
  assert(s->valid_bins == 4);
  assert(near(s->total_distance_km, 0.202, 1e-9));
  assert(near(s->total_time_s, 60.0, 1e-9));
  assert(near(s->total_elevation_gain_m, 20.0, 1e-9));
  assert(s->avg_pace_min_per_km);
  assert(near(*s->avg_pace_min_per_km, (60.0 / 60.0) / 0.202, 1e-6));
  assert(s->avg_heart_rate_bpm && *s->avg_heart_rate_bpm == 150);
  assert(near(s->heart_rate_coverage, 0.25, 1e-12));
  printf("PASS: test_run_summary\n");
}

int main() {
  test_haversine();
  test_track_totals();
  test_bins_partition_track();
  test_bin_metrics();
  test_bin_heart_rate();
  test_zero_distance_bin();
  test_adjusted_duration();
  test_short_and_invalid_input();
  test_run_summary();
  printf("All geodesy/binning tests passed.\n");
  return 0;
}
