#pragma once
/**
 * @file run_result.h
 * @brief Per-file output of the batch layer and input of the cross-run analyzer.
 */

#include "gradepace/common/activity_types.h"
#include "gradepace/common/bin_types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gradepace {

struct RunResult {
  ActivityInfo info;
  double bin_length_m = 0.0;
  std::vector<Bin> bins;
  std::optional<RunSummary> summary;
  std::size_t route_point_count = 0;
  bool has_heart_rate_data = false;
  std::size_t file_index = 0;       // position in the submitted file list
};

struct FileError {
  std::string filename;
  std::string message;
};

} // namespace gradepace
