#include "gradepace/stats/statistics.h"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gradepace::stats {

const char* StatisticText(Statistic s) {
  return (s == Statistic::Median) ? "median" : "mean";
}

Statistic StatisticFromText(const std::string& s) {
  if (s == "mean") return Statistic::Mean;
  if (s == "median") return Statistic::Median;
  throw std::runtime_error("Unknown statistic '" + s + "' (expected mean|median)");
}

double Mean(const std::vector<double>& values) {
  typedef Eigen::Map<const Eigen::VectorXd> MapVec;
  MapVec v(values.data(), static_cast<Eigen::Index>(values.size()));
  return v.mean();
}

double Median(std::vector<double> values) {
  std::sort(values.begin(), values.end());
  const std::size_t n = values.size();
  if (n % 2 == 0) {
    return (values[n / 2 - 1] + values[n / 2]) / 2.0;
  }
  return values[n / 2];
}

double Compute(Statistic s, const std::vector<double>& values) {
  return (s == Statistic::Median) ? Median(values) : Mean(values);
}

bool IsPositiveFinite(double v) {
  return std::isfinite(v) && v > 0.0;
}

} // namespace gradepace::stats
