#pragma once
/**
 * @file grade_model_fit.h
 * @brief Weighted least-squares quartic fit of personal grade factors.
 */

#include "gradepace/plugins/grade/grade_model.h"
#include "gradepace/stats/gradient_analysis.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace gradepace::stats {

constexpr std::size_t kMinFitGroups = 5;

// Fits factor(g) = a g^4 + b g^3 + c g^2 + d g + e over the exact-degree entries,
// each weighted by its bin count. Folded extremes are ignored. Returns nullopt with
// fewer than kMinFitGroups usable entries or a non-finite solution.
std::optional<grade::QuarticCoefficients>
FitPersonalGradeModel(const std::vector<GradeAdjustmentEntry>& entries);

} // namespace gradepace::stats
