#pragma once
/**
 * @file grade_model.h
 * @brief Grade adjustment models: gradient percentage -> pace multiplier.
 *
 * A factor > 1 means the gradient is slower than flat running at equal effort.
 * All models clamp the input gradient to [-kMaxAbsGradientPct, kMaxAbsGradientPct].
 */

#include <array>
#include <memory>
#include <string>

namespace gradepace::grade {

constexpr double kMaxAbsGradientPct = 35.0;

double ClampGradient(double gradient_pct);

class IGradeModel {
public:
  virtual ~IGradeModel() = default;

  virtual std::string Name() const = 0;

  // Pace multiplier at the given gradient (percent). May be non-finite or <= 0
  // for user-supplied coefficients; callers decide how to treat that.
  virtual double Factor(double gradient_pct) const = 0;
};

// max(0.3, 1 + 0.033 g + 0.000233 g^2); no upper cap.
class QuadraticGradeModel final : public IGradeModel {
public:
  static constexpr double kLinear = 0.033;
  static constexpr double kQuadratic = 0.000233;
  static constexpr double kFloor = 0.3;

  std::string Name() const override { return "quadratic"; }
  double Factor(double gradient_pct) const override;
};

// a g^4 + b g^3 + c g^2 + d g + e
struct QuarticCoefficients {
  double a = 0.0;
  double b = 0.0;
  double c = 0.0;
  double d = 0.0;
  double e = 1.0;

  std::array<double, 5> as_array() const { return {a, b, c, d, e}; }
};

// Published running-economy fit used as the literature reference curve.
QuarticCoefficients LiteratureCoefficients();

class QuarticGradeModel final : public IGradeModel {
public:
  QuarticGradeModel() : coeffs_(LiteratureCoefficients()) {}
  explicit QuarticGradeModel(const QuarticCoefficients& coeffs) : coeffs_(coeffs) {}

  std::string Name() const override { return "quartic"; }
  double Factor(double gradient_pct) const override;

  const QuarticCoefficients& coefficients() const { return coeffs_; }

private:
  QuarticCoefficients coeffs_;
};

struct GradeModelConfig {
  // "quadratic" or "quartic"
  std::string type = "quadratic";
  bool has_coefficients = false;
  QuarticCoefficients coefficients{};
};

std::unique_ptr<IGradeModel> CreateGradeModel(const GradeModelConfig& cfg);

} // namespace gradepace::grade
