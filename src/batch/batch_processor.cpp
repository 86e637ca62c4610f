#include "gradepace/batch/batch_processor.h"

#include "gradepace/binning/distance_binner.h"
#include "gradepace/binning/run_summary.h"
#include "gradepace/io/activity_reader.h"

#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

namespace gradepace::batch {

const char* EventKindText(EventKind k) {
  switch (k) {
    case EventKind::Progress: return "progress";
    case EventKind::Complete: return "complete";
    case EventKind::Error:    return "error";
  }
  return "unknown";
}

const char* JobStateText(JobState s) {
  switch (s) {
    case JobState::Created:    return "created";
    case JobState::Processing: return "processing";
    case JobState::Completed:  return "completed";
    case JobState::Failed:     return "failed";
  }
  return "unknown";
}

void ValidateBatchRequest(const std::vector<ActivityFile>& files, const BatchOptions& opts) {
  if (files.empty()) {
    throw std::invalid_argument("No files uploaded");
  }
  if (!std::isfinite(opts.bin_length_m) || opts.bin_length_m <= 0.0) {
    throw std::invalid_argument("Invalid bin length: must be a positive number of meters");
  }
  if (opts.max_files > 0 && files.size() > opts.max_files) {
    throw std::invalid_argument("Too many files: " + std::to_string(files.size()) +
                                " (limit " + std::to_string(opts.max_files) + ")");
  }
}

BatchSummary SummarizeBatch(const ResultList& results, std::size_t failed_files,
                            std::size_t total_files, double bin_length_m) {
  BatchSummary s;
  s.total_files = total_files;
  s.successful_files = results.size();
  s.failed_files = failed_files;
  s.bin_length_m = bin_length_m;
  for (const auto& r : results) {
    s.total_bins += r->bins.size();
    if (r->has_heart_rate_data) ++s.files_with_heart_rate;
  }
  if (!results.empty()) {
    const double avg = static_cast<double>(s.total_bins) / static_cast<double>(results.size());
    s.avg_bins_per_file = std::round(avg * 10.0) / 10.0;
  }
  return s;
}

BatchProcessor::BatchProcessor() : reader_(&io::ReadActivity) {}

BatchProcessor::BatchProcessor(ReaderFn reader) : reader_(std::move(reader)) {
  if (!reader_) throw std::invalid_argument("BatchProcessor requires a reader");
}

RunResult BatchProcessor::ProcessFile(const ActivityFile& file,
                                      std::size_t file_index,
                                      const BatchOptions& opts) const {
  if (opts.max_file_bytes > 0 && file.bytes.size() > opts.max_file_bytes) {
    throw io::ActivityReadError("File exceeds the maximum size of " +
                                std::to_string(opts.max_file_bytes) + " bytes");
  }

  const Activity activity = reader_(file);
  if (activity.points.empty()) {
    throw io::ActivityReadError("No track data found");
  }

  binning::BinningOptions bopts;
  bopts.bin_length_m = opts.bin_length_m;
  bopts.grade_model = opts.grade_model.get();
  bopts.reference_velocity_mps = opts.reference_velocity_mps;

  RunResult r;
  r.info = io::SummarizeActivity(activity);
  r.bin_length_m = opts.bin_length_m;
  r.bins = binning::BuildBins(activity.points, bopts);
  r.summary = binning::Summarize(r.bins);
  r.route_point_count = activity.points.size();
  r.has_heart_rate_data = binning::HasHeartRateData(r.bins);
  r.file_index = file_index;
  return r;
}

bool BatchProcessor::Run(const std::string& job_id,
                         const std::vector<ActivityFile>& files,
                         const BatchOptions& opts,
                         const EventSink& sink,
                         const CancelFn& cancelled,
                         std::chrono::milliseconds pacing) const {
  ValidateBatchRequest(files, opts);

  const std::size_t total = files.size();
  ResultList results;
  std::vector<FileError> errors;
  results.reserve(total);

  for (std::size_t i = 0; i < total; ++i) {
    if (cancelled && cancelled()) {
      if (opts.verbose) {
        std::cout << "[batch] " << job_id << " cancelled after " << i << "/" << total << " files\n";
      }
      return false;
    }

    const ActivityFile& f = files[i];
    try {
      results.push_back(std::make_shared<const RunResult>(ProcessFile(f, i, opts)));
      if (opts.verbose) {
        std::cout << "[batch] " << f.filename << ": " << results.back()->bins.size() << " bins\n";
      }
    } catch (const std::exception& e) {
      errors.push_back(FileError{f.filename, e.what()});
      if (opts.verbose) {
        std::cerr << "WARNING: " << f.filename << ": " << e.what() << "\n";
      }
    }

    BatchEvent ev;
    ev.kind = EventKind::Progress;
    ev.job_id = job_id;
    ev.processed = i + 1;
    ev.total = total;
    ev.percent = static_cast<int>(std::lround(100.0 * static_cast<double>(i + 1) / static_cast<double>(total)));
    ev.current_file = f.filename;
    ev.results = results;
    ev.errors = errors;
    if (sink) sink(ev);

    if (pacing.count() > 0 && i + 1 < total) {
      std::this_thread::sleep_for(pacing);
    }
  }

  BatchEvent done;
  done.kind = EventKind::Complete;
  done.job_id = job_id;
  done.processed = total;
  done.total = total;
  done.percent = 100;
  done.summary = SummarizeBatch(results, errors.size(), total, opts.bin_length_m);
  done.results = std::move(results);
  done.errors = std::move(errors);
  if (sink) sink(done);
  return true;
}

BatchReport BatchProcessor::Process(const std::vector<ActivityFile>& files,
                                    const BatchOptions& opts,
                                    const EventSink& progress) const {
  BatchReport report;
  Run("sync", files, opts, [&](const BatchEvent& ev) {
    if (ev.kind == EventKind::Progress) {
      if (progress) progress(ev);
      return;
    }
    report.results.reserve(ev.results.size());
    for (const auto& r : ev.results) report.results.push_back(*r);
    report.errors = ev.errors;
    if (ev.summary) report.summary = *ev.summary;
  });
  return report;
}

} // namespace gradepace::batch
