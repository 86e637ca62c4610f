#include "gradepace/config/config_loader.h"

#include "gradepace/config/xml_utils.h"
#include "gradepace/config/path_utils.h"

#include <cmath>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace gradepace::cfg {

// Each config file kind: expected root element and its schema in the XSD directory.
struct DocumentKind {
  const char* root;
  const char* xsd;
};

static const DocumentKind kSystemDoc{"SystemConfig", "system.xsd"};
static const DocumentKind kProfilesDoc{"AnalysisProfiles", "analysis_profiles.xsd"};
static const DocumentKind kBatchRuntimeDoc{"BatchRuntime", "batch_runtime.xsd"};

// Root element check, then XSD validation when a schema directory was given.
static void check_document(void* doc, const DocumentKind& kind, const std::string& xsd_dir,
                           const std::string& xml_path) {
  const std::string root = xmlu::RootName(doc);
  if (root != kind.root) {
    throw std::runtime_error(std::string("Expected root element '") + kind.root + "' but found '" +
                             root + "' (file: " + xml_path + ")");
  }
  if (xsd_dir.empty()) return;

  const fs::path xsd_path = fs::path(xsd_dir) / kind.xsd;
  if (!fs::exists(xsd_path)) {
    throw std::runtime_error("Schema file not found: " + xsd_path.string());
  }
  xmlu::ValidateOrThrow(doc, xsd_path.string(), xml_path);
}

static SystemConfig parse_system(void* doc) {
  SystemConfig c;
  c.active.analysis_profile_id = xmlu::GetAttr(doc, "SystemConfig/Active/AnalysisProfile", "id");

  c.refs.base_dir               = xmlu::GetAttr(doc, "SystemConfig/Refs", "baseDir");
  c.refs.analysis_profiles_href = xmlu::GetAttr(doc, "SystemConfig/Refs/AnalysisProfiles", "href");
  c.refs.batch_runtime_href     = xmlu::GetAttr(doc, "SystemConfig/Refs/BatchRuntime", "href");

  c.diagnostics.verbose = xmlu::GetBoolText(doc, "SystemConfig/Diagnostics/Verbose", false);
  c.diagnostics.print_run_summaries =
      xmlu::GetBoolText(doc, "SystemConfig/Diagnostics/PrintRunSummaries", true);
  c.diagnostics.print_exclusion_counts =
      xmlu::GetBoolText(doc, "SystemConfig/Diagnostics/PrintExclusionCounts", true);

  if (c.active.analysis_profile_id.empty()) {
    throw std::runtime_error("system.xml missing Active/AnalysisProfile id.");
  }
  if (c.refs.analysis_profiles_href.empty()) {
    throw std::runtime_error("system.xml missing required Refs/AnalysisProfiles href.");
  }
  return c;
}

static grade::GradeModelConfig parse_grade_model(void* n, const std::string& profile_id) {
  grade::GradeModelConfig g;
  const std::string type = xmlu::NodeGetAttrPath(n, "GradeModel", "type");
  if (!type.empty()) g.type = type;
  if (g.type != "quadratic" && g.type != "quartic") {
    throw std::runtime_error("Profile '" + profile_id + "' has unknown GradeModel type '" + g.type + "'.");
  }

  static const char* const kNames[] = {"a", "b", "c", "d", "e"};
  double* slots[] = {&g.coefficients.a, &g.coefficients.b, &g.coefficients.c,
                     &g.coefficients.d, &g.coefficients.e};
  int present = 0;
  for (int i = 0; i < 5; ++i) {
    const std::string what = "Profile '" + profile_id + "' GradeModel/Coefficients@" + kNames[i];
    auto v = xmlu::ParseOptionalDouble(xmlu::NodeGetAttrPath(n, "GradeModel/Coefficients", kNames[i]), what);
    if (v) {
      *slots[i] = *v;
      ++present;
    }
  }
  if (present != 0 && present != 5) {
    throw std::runtime_error("Profile '" + profile_id + "' GradeModel/Coefficients needs all of a..e.");
  }
  g.has_coefficients = (present == 5);
  return g;
}

static AnalysisProfiles parse_analysis_profiles(void* doc) {
  AnalysisProfiles out;
  auto nodes = xmlu::FindNodes(doc, "AnalysisProfiles/Profile");
  for (void* n : nodes) {
    AnalysisProfile p;
    p.id = xmlu::NodeGetAttr(n, "id");
    if (p.id.empty()) throw std::runtime_error("AnalysisProfiles/Profile missing id attribute.");

    p.bin_length_m = xmlu::NodeGetDoubleChild(n, "BinLengthMeters", p.bin_length_m);
    if (!std::isfinite(p.bin_length_m) || p.bin_length_m <= 0.0) {
      throw std::runtime_error("AnalysisProfiles/Profile '" + p.id + "' has invalid BinLengthMeters.");
    }

    p.reference_velocity_mps = xmlu::ParseOptionalDouble(
        xmlu::NodeGetTextChild(n, "ReferenceVelocityMps"), "Profile '" + p.id + "' ReferenceVelocityMps");
    if (p.reference_velocity_mps && !(*p.reference_velocity_mps > 0.0)) {
      throw std::runtime_error("AnalysisProfiles/Profile '" + p.id + "' has invalid ReferenceVelocityMps.");
    }

    p.grade_model = parse_grade_model(n, p.id);

    ReliabilityCfg& r = p.reliability;
    r.enabled              = xmlu::NodeGetBoolPath(n, "Reliability/Enabled", r.enabled);
    r.min_speed_kmh        = xmlu::NodeGetDoublePath(n, "Reliability/MinSpeedKmh", r.min_speed_kmh);
    r.max_speed_kmh        = xmlu::NodeGetDoublePath(n, "Reliability/MaxSpeedKmh", r.max_speed_kmh);
    r.max_abs_gradient_pct = xmlu::NodeGetDoublePath(n, "Reliability/MaxAbsGradientPercent", r.max_abs_gradient_pct);
    r.min_duration_s       = xmlu::NodeGetDoublePath(n, "Reliability/MinDurationSeconds", r.min_duration_s);
    if (r.min_speed_kmh > r.max_speed_kmh) {
      throw std::runtime_error("AnalysisProfiles/Profile '" + p.id + "' has MinSpeedKmh > MaxSpeedKmh.");
    }

    p.heart_rate.min_bpm = xmlu::ParseOptionalInt(xmlu::NodeGetAttrPath(n, "HeartRate", "min"),
                                                  "Profile '" + p.id + "' HeartRate@min");
    p.heart_rate.max_bpm = xmlu::ParseOptionalInt(xmlu::NodeGetAttrPath(n, "HeartRate", "max"),
                                                  "Profile '" + p.id + "' HeartRate@max");

    const std::string stat = xmlu::NodeGetAttrPath(n, "AdjustmentView", "statistic");
    if (!stat.empty()) p.adjustment_statistic = stat;
    if (p.adjustment_statistic != "mean" && p.adjustment_statistic != "median") {
      throw std::runtime_error("AnalysisProfiles/Profile '" + p.id + "' has invalid AdjustmentView statistic '" +
                               p.adjustment_statistic + "'.");
    }

    out.by_id[p.id] = p;
  }
  if (out.by_id.empty()) {
    throw std::runtime_error("No AnalysisProfiles/Profile entries found.");
  }
  return out;
}

static BatchRuntimeCfg parse_batch_runtime(void* doc) {
  BatchRuntimeCfg b;
  b.max_files          = xmlu::GetInt(doc, "BatchRuntime/MaxFiles", b.max_files);
  b.max_file_bytes     = static_cast<long long>(
      xmlu::GetDouble(doc, "BatchRuntime/MaxFileBytes", static_cast<double>(b.max_file_bytes)));
  b.job_ttl_s          = xmlu::GetDouble(doc, "BatchRuntime/JobTtlSeconds", b.job_ttl_s);
  b.sweep_interval_s   = xmlu::GetDouble(doc, "BatchRuntime/SweepIntervalSeconds", b.sweep_interval_s);
  b.progress_pacing_ms = xmlu::GetInt(doc, "BatchRuntime/ProgressPacingMs", b.progress_pacing_ms);

  if (b.max_files <= 0) throw std::runtime_error("BatchRuntime/MaxFiles invalid.");
  if (b.max_file_bytes <= 0) throw std::runtime_error("BatchRuntime/MaxFileBytes invalid.");
  if (!(b.job_ttl_s > 0.0)) throw std::runtime_error("BatchRuntime/JobTtlSeconds invalid.");
  if (!(b.sweep_interval_s > 0.0)) throw std::runtime_error("BatchRuntime/SweepIntervalSeconds invalid.");
  if (b.progress_pacing_ms < 0) throw std::runtime_error("BatchRuntime/ProgressPacingMs invalid.");
  return b;
}

ConfigBundle ConfigLoader::Defaults() {
  ConfigBundle bundle;
  bundle.system.active.analysis_profile_id = "default";
  bundle.analysis.id = "default";
  bundle.profiles.by_id[bundle.analysis.id] = bundle.analysis;
  return bundle;
}

ConfigBundle ConfigLoader::Load(const std::string& system_xml_path,
                                const std::string& xsd_dir,
                                const std::string& profile_override) {
  ConfigBundle bundle;
  bundle.paths.system_xml = fs::path(system_xml_path).lexically_normal().string();
  bundle.paths.xsd_dir = xsd_dir;

  // 1) system.xml
  {
    xmlu::DocGuard doc(xmlu::ReadXmlDocOrThrow(bundle.paths.system_xml));
    check_document(doc.get(), kSystemDoc, xsd_dir, bundle.paths.system_xml);
    bundle.system = parse_system(doc.get());
  }
  if (!profile_override.empty()) {
    bundle.system.active.analysis_profile_id = profile_override;
  }

  // Resolve referenced XML paths relative to system.xml and baseDir
  const std::string base = bundle.system.refs.base_dir;
  bundle.paths.analysis_profiles_xml =
      pathu::ResolveHref(bundle.paths.system_xml, base, bundle.system.refs.analysis_profiles_href);
  if (!bundle.system.refs.batch_runtime_href.empty()) {
    bundle.paths.batch_runtime_xml =
        pathu::ResolveHref(bundle.paths.system_xml, base, bundle.system.refs.batch_runtime_href);
  }

  // 2) analysis_profiles.xml
  {
    xmlu::DocGuard doc(xmlu::ReadXmlDocOrThrow(bundle.paths.analysis_profiles_xml));
    check_document(doc.get(), kProfilesDoc, xsd_dir, bundle.paths.analysis_profiles_xml);
    try {
      bundle.profiles = parse_analysis_profiles(doc.get());
    } catch (const std::runtime_error& e) {
      throw std::runtime_error(std::string(e.what()) + " (file: " + bundle.paths.analysis_profiles_xml + ")");
    }
  }

  auto it = bundle.profiles.by_id.find(bundle.system.active.analysis_profile_id);
  if (it == bundle.profiles.by_id.end()) {
    throw std::runtime_error("Active AnalysisProfile id not found: " + bundle.system.active.analysis_profile_id);
  }
  bundle.analysis = it->second;

  // 3) batch_runtime.xml (optional)
  if (!bundle.paths.batch_runtime_xml.empty()) {
    xmlu::DocGuard doc(xmlu::ReadXmlDocOrThrow(bundle.paths.batch_runtime_xml));
    check_document(doc.get(), kBatchRuntimeDoc, xsd_dir, bundle.paths.batch_runtime_xml);
    try {
      bundle.batch_runtime = parse_batch_runtime(doc.get());
    } catch (const std::runtime_error& e) {
      throw std::runtime_error(std::string(e.what()) + " (file: " + bundle.paths.batch_runtime_xml + ")");
    }
    bundle.has_batch_runtime = true;
  }

  return bundle;
}

} // namespace gradepace::cfg
