#pragma once
/**
 * @file distance_binner.h
 * @brief Incremental distance binning of a point sequence.
 *
 * A bin closes at the first point where the accumulated haversine distance since
 * the previous bin end reaches the configured length. The closing point is shared:
 * it is the end of one bin and the start of the next, so index ranges are
 * contiguous and cover [0, n-1]. Distance left over after the last closed bin
 * becomes one shorter remainder bin.
 */

#include "gradepace/common/activity_types.h"
#include "gradepace/common/bin_types.h"
#include "gradepace/plugins/grade/grade_model.h"

#include <optional>
#include <vector>

namespace gradepace::binning {

struct BinningOptions {
  double bin_length_m = 50.0;

  // Both must be set (and the velocity > 0) for adjusted duration / GAP distance.
  const grade::IGradeModel* grade_model = nullptr;
  std::optional<double> reference_velocity_mps;
};

/**
 * @brief Split a point sequence into distance bins.
 *
 * @return Empty when fewer than two points are given.
 * @throws std::invalid_argument if bin_length_m is not a finite positive number.
 */
std::vector<Bin> BuildBins(const PointSequence& points, const BinningOptions& opts);

inline std::vector<Bin> BuildBins(const PointSequence& points, double bin_length_m) {
  BinningOptions opts;
  opts.bin_length_m = bin_length_m;
  return BuildBins(points, opts);
}

} // namespace gradepace::binning
