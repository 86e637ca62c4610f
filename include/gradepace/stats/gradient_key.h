#pragma once
/**
 * @file gradient_key.h
 * @brief Per-degree gradient group key with folded extremes.
 *
 * Gradients are rounded to the nearest integer (halves toward +inf). Rounded
 * values <= -35 fold into AtMost(-35) and values >= 35 into AtLeast(35).
 * Ordering: AtMost < Exact (ascending) < AtLeast.
 */

#include <string>

namespace gradepace::stats {

class GradientKey {
public:
  enum class Kind {
    AtMost,
    Exact,
    AtLeast
  };

  static constexpr int kExtreme = 35;

  GradientKey() = default;   // Exact(0)

  static GradientKey Exact(int degree) { return GradientKey(Kind::Exact, degree); }
  static GradientKey AtMost() { return GradientKey(Kind::AtMost, -kExtreme); }
  static GradientKey AtLeast() { return GradientKey(Kind::AtLeast, kExtreme); }

  static GradientKey FromGradient(double gradient_pct);

  Kind kind() const { return kind_; }
  int value() const { return value_; }
  bool is_exact() const { return kind_ == Kind::Exact; }

  // "<=-35", ">=35", or the integer degree.
  std::string Label() const;

  bool operator==(const GradientKey& o) const { return kind_ == o.kind_ && value_ == o.value_; }
  bool operator!=(const GradientKey& o) const { return !(*this == o); }
  bool operator<(const GradientKey& o) const;

private:
  GradientKey(Kind k, int v) : kind_(k), value_(v) {}

  Kind kind_ = Kind::Exact;
  int value_ = 0;
};

} // namespace gradepace::stats
