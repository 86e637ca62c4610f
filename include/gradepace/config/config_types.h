#pragma once
/**
 * Parsed gradepace configuration. ConfigLoader fills and validates these; member defaults
 * equal the built-in analysis behaviour, so an omitted optional file or element is harmless.
 */

#include "gradepace/plugins/grade/grade_model.h"

#include <map>
#include <optional>
#include <string>

namespace gradepace::cfg {

// System wiring (system.xml)
struct ActiveSelection {
  std::string analysis_profile_id;
};

struct SystemRefs {
  std::string base_dir;                // optional
  std::string analysis_profiles_href;
  std::string batch_runtime_href;      // optional
};

struct DiagnosticsCfg {
  bool verbose = false;                   // optional
  bool print_run_summaries = true;        // optional
  bool print_exclusion_counts = true;     // optional
};

struct SystemConfig {
  ActiveSelection active;
  SystemRefs refs;
  DiagnosticsCfg diagnostics{};
};

// Analysis profiles (analysis_profiles.xml)
struct ReliabilityCfg {
  bool enabled = false;
  double min_speed_kmh = 1.0;
  double max_speed_kmh = 30.0;
  double max_abs_gradient_pct = 30.0;
  double min_duration_s = 1.0;
};

struct HeartRateCfg {
  std::optional<int> min_bpm;
  std::optional<int> max_bpm;
};

struct AnalysisProfile {
  std::string id;
  double bin_length_m = 50.0;
  std::optional<double> reference_velocity_mps;   // optional
  grade::GradeModelConfig grade_model{};
  ReliabilityCfg reliability{};
  HeartRateCfg heart_rate{};
  std::string adjustment_statistic = "mean";      // "mean" | "median"
};

struct AnalysisProfiles {
  std::map<std::string, AnalysisProfile> by_id;
};

// Batch runtime (batch_runtime.xml)
struct BatchRuntimeCfg {
  int max_files = 50;
  long long max_file_bytes = 50LL * 1024 * 1024;
  double job_ttl_s = 600.0;
  double sweep_interval_s = 30.0;
  int progress_pacing_ms = 0;
};

// Resolved bundle (what the app uses)
struct ResolvedPaths {
  std::string system_xml;
  std::string xsd_dir;              // optional
  std::string analysis_profiles_xml;
  std::string batch_runtime_xml;    // optional
};

struct ConfigBundle {
  ResolvedPaths paths;

  SystemConfig system;
  AnalysisProfiles profiles;
  AnalysisProfile analysis;         // the active profile

  BatchRuntimeCfg batch_runtime;    // default-initialized if not present
  bool has_batch_runtime = false;
};

} // namespace gradepace::cfg
