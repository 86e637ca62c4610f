#include "gradepace/plugins/grade/grade_model.h"

#include <algorithm>
#include <stdexcept>

namespace gradepace::grade {

double ClampGradient(double gradient_pct) {
  return std::max(-kMaxAbsGradientPct, std::min(kMaxAbsGradientPct, gradient_pct));
}

double QuadraticGradeModel::Factor(double gradient_pct) const {
  const double g = ClampGradient(gradient_pct);
  const double f = 1.0 + g * kLinear + g * g * kQuadratic;
  return std::max(kFloor, f);
}

QuarticCoefficients LiteratureCoefficients() {
  QuarticCoefficients c;
  c.a = -5.294439830640173e-7;
  c.b = -0.000003989571857841264;
  c.c = 0.0020535661142752205;
  c.d = 0.03265674125152065;
  c.e = 1.0;
  return c;
}

double QuarticGradeModel::Factor(double gradient_pct) const {
  const double g = ClampGradient(gradient_pct);
  // Horner form of a g^4 + b g^3 + c g^2 + d g + e
  return (((coeffs_.a * g + coeffs_.b) * g + coeffs_.c) * g + coeffs_.d) * g + coeffs_.e;
}

std::unique_ptr<IGradeModel> CreateGradeModel(const GradeModelConfig& cfg) {
  if (cfg.type == "quadratic") {
    return std::make_unique<QuadraticGradeModel>();
  }

  if (cfg.type == "quartic") {
    if (cfg.has_coefficients) {
      return std::make_unique<QuarticGradeModel>(cfg.coefficients);
    }
    return std::make_unique<QuarticGradeModel>();
  }

  throw std::runtime_error("CreateGradeModel: unknown model type '" + cfg.type + "'");
}

} // namespace gradepace::grade
