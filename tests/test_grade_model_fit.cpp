#undef NDEBUG
#include <cassert>
#include <cmath>
#include <cstdio>
#include <vector>

#include "gradepace/plugins/grade/grade_model.h"
#include "gradepace/stats/grade_model_fit.h"

using namespace gradepace;
using namespace gradepace::stats;

static GradeAdjustmentEntry entry(const GradientKey& key, double factor, std::size_t bins) {
  GradeAdjustmentEntry e;
  e.key = key;
  e.gradient_value = KeyGradientValue(key);
  e.personal_factor = factor;
  e.pace_min_per_km = 6.0 * factor;
  e.bin_count = bins;
  return e;
}

void test_recovers_known_curve() {
  grade::QuarticCoefficients truth;
  truth.a = 1.0e-6;
  truth.b = -2.0e-5;
  truth.c = 0.0015;
  truth.d = 0.028;
  truth.e = 1.0;
  const grade::QuarticGradeModel curve(truth);

  std::vector<GradeAdjustmentEntry> entries;
  for (int g = -12; g <= 12; g += 2) {
    entries.push_back(entry(GradientKey::Exact(g), curve.Factor(g), 1 + static_cast<std::size_t>(std::abs(g))));
  }

  const auto fit = FitPersonalGradeModel(entries);
  assert(fit);
  const grade::QuarticGradeModel fitted(*fit);
  for (double g = -12.0; g <= 12.0; g += 0.5) {
    assert(std::fabs(fitted.Factor(g) - curve.Factor(g)) < 1e-8);
  }
  assert(std::fabs(fit->e - 1.0) < 1e-8);
  printf("PASS: test_recovers_known_curve\n");
}

void test_weights_follow_bin_counts() {
  // Two conflicting observations at g=0; the heavier one dominates the intercept.
  std::vector<GradeAdjustmentEntry> entries = {
    entry(GradientKey::Exact(-4), 0.9, 10),
    entry(GradientKey::Exact(-2), 0.95, 10),
    entry(GradientKey::Exact(0), 1.0, 100),
    entry(GradientKey::Exact(0), 1.2, 1),
    entry(GradientKey::Exact(2), 1.05, 10),
    entry(GradientKey::Exact(4), 1.1, 10),
  };
  const auto fit = FitPersonalGradeModel(entries);
  assert(fit);
  assert(std::fabs(fit->e - 1.0) < 0.01);
  printf("PASS: test_weights_follow_bin_counts\n");
}

void test_too_few_groups() {
  std::vector<GradeAdjustmentEntry> entries = {
    entry(GradientKey::Exact(-2), 0.95, 3),
    entry(GradientKey::Exact(0), 1.0, 3),
    entry(GradientKey::Exact(2), 1.05, 3),
    entry(GradientKey::Exact(4), 1.1, 3),
  };
  assert(!FitPersonalGradeModel(entries));

  // Folded extremes and empty groups do not count toward the minimum.
  entries.push_back(entry(GradientKey::AtLeast(), 3.0, 5));
  entries.push_back(entry(GradientKey::Exact(6), 1.2, 0));
  assert(!FitPersonalGradeModel(entries));

  entries.push_back(entry(GradientKey::Exact(6), 1.2, 2));
  assert(FitPersonalGradeModel(entries));

  assert(!FitPersonalGradeModel({}));
  printf("PASS: test_too_few_groups\n");
}

int main() {
  test_recovers_known_curve();
  test_weights_follow_bin_counts();
  test_too_few_groups();
  printf("All grade model fit tests passed.\n");
  return 0;
}
