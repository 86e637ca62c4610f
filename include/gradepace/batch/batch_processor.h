#pragma once
/**
 * @file batch_processor.h
 * @brief Sequential per-file pipeline (read -> bin -> summarize) with failure isolation.
 *
 * Files are processed strictly in submission order. A failing file becomes a
 * FileError and the batch continues. One progress event follows every file; a
 * complete event closes the run.
 */

#include "gradepace/batch/batch_types.h"
#include "gradepace/common/activity_types.h"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace gradepace::batch {

using ReaderFn = std::function<Activity(const ActivityFile&)>;
using EventSink = std::function<void(const BatchEvent&)>;
using CancelFn = std::function<bool()>;

// Request-level checks (file count, bin length, limits).
// @throws std::invalid_argument
void ValidateBatchRequest(const std::vector<ActivityFile>& files, const BatchOptions& opts);

BatchSummary SummarizeBatch(const ResultList& results, std::size_t failed_files,
                            std::size_t total_files, double bin_length_m);

class BatchProcessor {
public:
  // Defaults to io::ReadActivity.
  BatchProcessor();
  explicit BatchProcessor(ReaderFn reader);

  // Read, bin and summarize one file. @throws on any file-level failure.
  RunResult ProcessFile(const ActivityFile& file, std::size_t file_index, const BatchOptions& opts) const;

  /**
   * @brief Streaming run: emits progress after each file, then one Complete event.
   *
   * @param cancelled Polled before each file; when it returns true the run stops
   *                  without a terminal event.
   * @param pacing Optional delay after each progress event except the last.
   * @return true when the Complete event was emitted.
   * @throws std::invalid_argument on request-level failures (before any event).
   */
  bool Run(const std::string& job_id,
           const std::vector<ActivityFile>& files,
           const BatchOptions& opts,
           const EventSink& sink,
           const CancelFn& cancelled = CancelFn(),
           std::chrono::milliseconds pacing = std::chrono::milliseconds(0)) const;

  // Synchronous mode. `progress` (optional) receives the progress events.
  BatchReport Process(const std::vector<ActivityFile>& files,
                      const BatchOptions& opts,
                      const EventSink& progress = EventSink()) const;

private:
  ReaderFn reader_;
};

} // namespace gradepace::batch
