#pragma once
/**
 * @file batch_types.h
 * @brief Options, events and reports of the batch layer.
 */

#include "gradepace/common/run_result.h"
#include "gradepace/plugins/grade/grade_model.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gradepace::batch {

struct BatchOptions {
  double bin_length_m = 50.0;

  // Optional grade adjustment; both must be set for adjusted durations.
  std::shared_ptr<const grade::IGradeModel> grade_model;
  std::optional<double> reference_velocity_mps;

  // Request limits; 0 disables the check.
  std::size_t max_files = 0;
  std::size_t max_file_bytes = 0;

  // Print per-file diagnostics to std::cout / std::cerr.
  bool verbose = false;
};

// Results are shared between consecutive cumulative events instead of copied.
using ResultList = std::vector<std::shared_ptr<const RunResult>>;

struct BatchSummary {
  std::size_t total_files = 0;
  std::size_t successful_files = 0;
  std::size_t failed_files = 0;
  double bin_length_m = 0.0;
  std::size_t total_bins = 0;
  double avg_bins_per_file = 0.0;     // one decimal
  std::size_t files_with_heart_rate = 0;
};

enum class EventKind {
  Progress,
  Complete,
  Error
};

const char* EventKindText(EventKind k);

// Tagged event. Progress and Complete carry the cumulative lists; Complete adds the
// summary; Error carries only the message.
struct BatchEvent {
  EventKind kind = EventKind::Progress;
  std::string job_id;

  std::size_t processed = 0;
  std::size_t total = 0;
  int percent = 0;
  std::string current_file;

  ResultList results;
  std::vector<FileError> errors;

  std::optional<BatchSummary> summary;
  std::string message;

  bool terminal() const { return kind != EventKind::Progress; }
};

struct BatchReport {
  std::vector<RunResult> results;
  std::vector<FileError> errors;
  BatchSummary summary;
};

enum class JobState {
  Created,
  Processing,
  Completed,
  Failed
};

const char* JobStateText(JobState s);

} // namespace gradepace::batch
