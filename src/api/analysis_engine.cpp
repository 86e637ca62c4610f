#include "gradepace/api/analysis_engine.h"

#include "gradepace/binning/distance_binner.h"
#include "gradepace/stats/statistics.h"

#include <stdexcept>
#include <utility>

namespace gradepace::api {

bool AnalysisEngine::Initialize(const std::string& system_xml, const std::string& xsd_dir,
                                const std::string& profile_override) {
  return Initialize(cfg::ConfigLoader::Load(system_xml, xsd_dir, profile_override));
}

bool AnalysisEngine::Initialize(const cfg::ConfigBundle& bundle) {
  cfg_ = bundle;
  grade_model_ = grade::CreateGradeModel(cfg_.analysis.grade_model);
  initialized_ = true;
  return initialized_;
}

void AnalysisEngine::RequireInitialized() const {
  if (!initialized_) {
    throw std::runtime_error("AnalysisEngine used before Initialize()");
  }
}

const grade::IGradeModel& AnalysisEngine::grade_model() const {
  RequireInitialized();
  return *grade_model_;
}

batch::BatchOptions AnalysisEngine::MakeBatchOptions(bool verbose) const {
  RequireInitialized();
  batch::BatchOptions o;
  o.bin_length_m = cfg_.analysis.bin_length_m;
  o.grade_model = grade_model_;
  o.reference_velocity_mps = cfg_.analysis.reference_velocity_mps;
  o.max_files = static_cast<std::size_t>(cfg_.batch_runtime.max_files);
  o.max_file_bytes = static_cast<std::size_t>(cfg_.batch_runtime.max_file_bytes);
  o.verbose = verbose;
  return o;
}

filter::FilterOptions AnalysisEngine::MakeFilterOptions(const AnalysisRequest& req) const {
  RequireInitialized();
  const cfg::AnalysisProfile& p = cfg_.analysis;

  filter::FilterOptions f;
  f.check_physical_plausibility = req.filter_unreliable.value_or(p.reliability.enabled);
  f.thresholds.min_speed_kmh = p.reliability.min_speed_kmh;
  f.thresholds.max_speed_kmh = p.reliability.max_speed_kmh;
  f.thresholds.max_abs_gradient_pct = p.reliability.max_abs_gradient_pct;
  f.thresholds.min_duration_s = p.reliability.min_duration_s;

  if (req.heart_rate) {
    if (req.heart_rate->active()) f.heart_rate = req.heart_rate;
  } else if (p.heart_rate.min_bpm || p.heart_rate.max_bpm) {
    f.heart_rate = filter::HeartRateRange{p.heart_rate.min_bpm, p.heart_rate.max_bpm};
  }
  return f;
}

std::vector<Bin> AnalysisEngine::BinPoints(const PointSequence& points) const {
  RequireInitialized();
  binning::BinningOptions o;
  o.bin_length_m = cfg_.analysis.bin_length_m;
  o.grade_model = grade_model_.get();
  o.reference_velocity_mps = cfg_.analysis.reference_velocity_mps;
  return binning::BuildBins(points, o);
}

batch::BatchReport AnalysisEngine::ProcessBatch(const std::vector<ActivityFile>& files,
                                                const batch::EventSink& progress) const {
  return processor_.Process(files, MakeBatchOptions(), progress);
}

AnalysisResponse AnalysisEngine::Analyze(const AnalysisRequest& req) const {
  RequireInitialized();
  if (!req.runs) {
    throw std::invalid_argument("No results provided");
  }

  stats::GradientPaceOptions opts;
  opts.view_statistic = stats::StatisticFromText(cfg_.analysis.adjustment_statistic);

  AnalysisResponse resp;
  const filter::FilterOptions f = MakeFilterOptions(req);
  if (f.check_physical_plausibility || (f.heart_rate && f.heart_rate->active())) {
    resp.filtering = filter::FilterRuns(*req.runs, f);
    resp.report = stats::AnalyzeGradientPace(resp.filtering->runs, opts);
  } else {
    resp.report = stats::AnalyzeGradientPace(*req.runs, opts);
  }
  return resp;
}

} // namespace gradepace::api
