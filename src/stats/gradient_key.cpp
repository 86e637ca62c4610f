#include "gradepace/stats/gradient_key.h"

#include <cmath>

namespace gradepace::stats {

GradientKey GradientKey::FromGradient(double gradient_pct) {
  const double r = std::floor(gradient_pct + 0.5);
  if (r <= -kExtreme) return AtMost();
  if (r >= kExtreme) return AtLeast();
  return Exact(static_cast<int>(r));
}

std::string GradientKey::Label() const {
  switch (kind_) {
    case Kind::AtMost:  return "<=" + std::to_string(value_);
    case Kind::AtLeast: return ">=" + std::to_string(value_);
    case Kind::Exact:   break;
  }
  return std::to_string(value_);
}

bool GradientKey::operator<(const GradientKey& o) const {
  if (kind_ != o.kind_) {
    return static_cast<int>(kind_) < static_cast<int>(o.kind_);
  }
  return value_ < o.value_;
}

} // namespace gradepace::stats
