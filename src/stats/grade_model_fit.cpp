#include "gradepace/stats/grade_model_fit.h"

#include <Eigen/Dense>

#include <cmath>

namespace gradepace::stats {

std::optional<grade::QuarticCoefficients>
FitPersonalGradeModel(const std::vector<GradeAdjustmentEntry>& entries) {
  std::vector<const GradeAdjustmentEntry*> usable;
  usable.reserve(entries.size());
  for (const auto& e : entries) {
    if (!e.key.is_exact() || e.bin_count == 0) continue;
    if (!std::isfinite(e.personal_factor)) continue;
    usable.push_back(&e);
  }
  if (usable.size() < kMinFitGroups) return std::nullopt;

  const Eigen::Index n = static_cast<Eigen::Index>(usable.size());
  Eigen::MatrixXd A(n, 5);
  Eigen::VectorXd y(n);

  for (Eigen::Index i = 0; i < n; ++i) {
    const GradeAdjustmentEntry& e = *usable[static_cast<std::size_t>(i)];
    const double g = e.gradient_value;
    const double w = std::sqrt(static_cast<double>(e.bin_count));
    A(i, 0) = w * g * g * g * g;
    A(i, 1) = w * g * g * g;
    A(i, 2) = w * g * g;
    A(i, 3) = w * g;
    A(i, 4) = w;
    y(i) = w * e.personal_factor;
  }

  const Eigen::VectorXd x = A.colPivHouseholderQr().solve(y);
  if (!x.allFinite()) return std::nullopt;

  grade::QuarticCoefficients c;
  c.a = x(0);
  c.b = x(1);
  c.c = x(2);
  c.d = x(3);
  c.e = x(4);
  return c;
}

} // namespace gradepace::stats
