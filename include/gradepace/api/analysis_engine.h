#pragma once

#include "gradepace/batch/batch_processor.h"
#include "gradepace/batch/batch_types.h"
#include "gradepace/common/activity_types.h"
#include "gradepace/common/run_result.h"
#include "gradepace/config/config_loader.h"
#include "gradepace/config/config_types.h"
#include "gradepace/filter/bin_reliability_filter.h"
#include "gradepace/plugins/grade/grade_model.h"
#include "gradepace/stats/gradient_analysis.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gradepace::api {

struct AnalysisRequest {
  // Absent run set is a request-level error; an empty one yields empty analyses.
  std::optional<std::vector<RunResult>> runs;

  // Unset fields fall back to the active profile.
  std::optional<bool> filter_unreliable;
  std::optional<filter::HeartRateRange> heart_rate;
};

struct AnalysisResponse {
  stats::GradientPaceReport report;
  std::optional<filter::RunSetFilterResult> filtering;   // set when a filter ran
};

// Facade over configuration, batch processing, filtering and analysis.
class AnalysisEngine {
public:
  AnalysisEngine() = default;

  // Load config and prepare the engine.
  bool Initialize(const std::string& system_xml, const std::string& xsd_dir,
                  const std::string& profile_override = "");
  bool Initialize(const cfg::ConfigBundle& bundle);

  const cfg::ConfigBundle& config() const { return cfg_; }
  const grade::IGradeModel& grade_model() const;

  // Bin length override (CLI --bin-length); validated at batch time.
  void SetBinLength(double bin_length_m) { cfg_.analysis.bin_length_m = bin_length_m; }

  batch::BatchOptions MakeBatchOptions(bool verbose = false) const;
  filter::FilterOptions MakeFilterOptions(const AnalysisRequest& req) const;

  std::vector<Bin> BinPoints(const PointSequence& points) const;

  batch::BatchReport ProcessBatch(const std::vector<ActivityFile>& files,
                                  const batch::EventSink& progress = batch::EventSink()) const;

  // @throws std::invalid_argument("No results provided") when req.runs is absent.
  AnalysisResponse Analyze(const AnalysisRequest& req) const;

private:
  void RequireInitialized() const;

  cfg::ConfigBundle cfg_{};
  std::shared_ptr<const grade::IGradeModel> grade_model_;
  batch::BatchProcessor processor_;
  bool initialized_ = false;
};

} // namespace gradepace::api
