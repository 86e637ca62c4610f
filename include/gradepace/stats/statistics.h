#pragma once

#include <string>
#include <vector>

namespace gradepace::stats {

enum class Statistic {
  Mean,
  Median
};

const char* StatisticText(Statistic s);

// Throws std::runtime_error for anything other than "mean" / "median".
Statistic StatisticFromText(const std::string& s);

// Arithmetic mean. Caller guarantees a non-empty input.
double Mean(const std::vector<double>& values);

// Middle value (odd count) or average of the two middle values (even count).
// Caller guarantees a non-empty input.
double Median(std::vector<double> values);

double Compute(Statistic s, const std::vector<double>& values);

// True for values usable as a pace or heart rate sample: finite and > 0.
bool IsPositiveFinite(double v);

} // namespace gradepace::stats
