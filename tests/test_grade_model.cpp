#undef NDEBUG
#include <cassert>
#include <cmath>
#include <cstdio>
#include <memory>
#include <stdexcept>

#include "gradepace/plugins/grade/grade_model.h"

using namespace gradepace::grade;

static bool near(double a, double b, double tol) { return std::fabs(a - b) <= tol; }

void test_quadratic_factor() {
  QuadraticGradeModel m;
  assert(m.Name() == "quadratic");
  assert(m.Factor(0.0) == 1.0);
  assert(near(m.Factor(10.0), 1.0 + 0.33 + 0.0233, 1e-12));
  assert(m.Factor(-5.0) < 1.0);
  printf("PASS: test_quadratic_factor\n");
}

void test_quadratic_clamp_and_floor() {
  QuadraticGradeModel m;
  // Clamped to +35 with no upper cap.
  const double at35 = 1.0 + 35.0 * 0.033 + 35.0 * 35.0 * 0.000233;
  assert(near(m.Factor(35.0), at35, 1e-12));
  assert(near(m.Factor(100.0), at35, 1e-12));
  // -35 evaluates below the floor.
  assert(m.Factor(-35.0) == QuadraticGradeModel::kFloor);
  assert(m.Factor(-100.0) == QuadraticGradeModel::kFloor);
  assert(ClampGradient(-80.0) == -kMaxAbsGradientPct);
  assert(ClampGradient(12.5) == 12.5);
  printf("PASS: test_quadratic_clamp_and_floor\n");
}

void test_quartic_literature() {
  QuarticGradeModel m;
  assert(m.Name() == "quartic");
  assert(m.Factor(0.0) == 1.0);
  assert(m.Factor(10.0) > 1.4 && m.Factor(10.0) < 1.6);
  assert(m.Factor(-10.0) < 1.0);
  assert(m.Factor(50.0) == m.Factor(35.0));

  const QuarticCoefficients c = LiteratureCoefficients();
  const double g = 7.0;
  const double direct = c.a * g * g * g * g + c.b * g * g * g + c.c * g * g + c.d * g + c.e;
  assert(near(m.Factor(g), direct, 1e-12));
  printf("PASS: test_quartic_literature\n");
}

void test_factory() {
  GradeModelConfig cfg;
  std::unique_ptr<IGradeModel> m = CreateGradeModel(cfg);
  assert(m->Name() == "quadratic");

  cfg.type = "quartic";
  m = CreateGradeModel(cfg);
  assert(m->Name() == "quartic");
  assert(near(m->Factor(5.0), QuarticGradeModel().Factor(5.0), 1e-15));

  cfg.has_coefficients = true;
  cfg.coefficients = QuarticCoefficients{0.0, 0.0, 0.0, 0.02, 1.0};
  m = CreateGradeModel(cfg);
  assert(near(m->Factor(10.0), 1.2, 1e-12));

  cfg.type = "cubic";
  bool threw = false;
  try {
    CreateGradeModel(cfg);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  printf("PASS: test_factory\n");
}

int main() {
  test_quadratic_factor();
  test_quadratic_clamp_and_floor();
  test_quartic_literature();
  test_factory();
  printf("All grade model tests passed.\n");
  return 0;
}
