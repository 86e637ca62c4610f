#pragma once

#include "gradepace/common/bin_types.h"

#include <optional>
#include <vector>

namespace gradepace::binning {

// Aggregate one run's bins. Bins with distance <= 0 are ignored; returns
// std::nullopt when no bin has a positive distance.
std::optional<RunSummary> Summarize(const std::vector<Bin>& bins);

// True when any bin carries an average heart rate.
bool HasHeartRateData(const std::vector<Bin>& bins);

} // namespace gradepace::binning
