/**
 * @file config_check.cpp
 * @brief Minimal executable that loads + (optionally) validates + prints the gradepace config bundle.
 */
#include "gradepace/config/config_loader.h"

#include <iostream>
#include <optional>
#include <string>

using namespace gradepace;

static void print_optional_bpm(const char* name, const std::optional<int>& v) {
  std::cout << " " << name << "=";
  if (v) {
    std::cout << *v;
  } else {
    std::cout << "(none)";
  }
}

static void print_bundle(const cfg::ConfigBundle& b) {
  std::cout << "=== ConfigBundle Summary ===\n";
  std::cout << "system.xml: " << b.paths.system_xml << "\n";
  std::cout << "xsd_dir:    " << (b.paths.xsd_dir.empty() ? "(none)" : b.paths.xsd_dir) << "\n\n";

  std::cout << "[Active]\n";
  std::cout << "  AnalysisProfile: " << b.system.active.analysis_profile_id << "\n\n";

  std::cout << "[Resolved Paths]\n";
  std::cout << "  analysis_profiles: " << b.paths.analysis_profiles_xml << "\n";
  if (!b.paths.batch_runtime_xml.empty()) std::cout << "  batch_runtime:     " << b.paths.batch_runtime_xml << "\n";
  std::cout << "\n";

  const cfg::AnalysisProfile& p = b.analysis;
  std::cout << "[AnalysisProfile]\n";
  std::cout << "  id=" << p.id
            << " bin_length_m=" << p.bin_length_m
            << " statistic=" << p.adjustment_statistic << "\n";
  std::cout << "  reference_velocity_mps=";
  if (p.reference_velocity_mps) {
    std::cout << *p.reference_velocity_mps << "\n";
  } else {
    std::cout << "(derived per bin)\n";
  }
  std::cout << "  grade_model=" << p.grade_model.type;
  if (p.grade_model.has_coefficients) {
    const auto& c = p.grade_model.coefficients;
    std::cout << " coefficients=(" << c.a << "," << c.b << "," << c.c << "," << c.d << "," << c.e << ")";
  }
  std::cout << "\n";
  std::cout << "  reliability.enabled=" << (p.reliability.enabled ? "true" : "false")
            << " speed_kmh=[" << p.reliability.min_speed_kmh << "," << p.reliability.max_speed_kmh << "]"
            << " max_abs_gradient_pct=" << p.reliability.max_abs_gradient_pct
            << " min_duration_s=" << p.reliability.min_duration_s << "\n";
  std::cout << "  heart_rate:";
  print_optional_bpm("min", p.heart_rate.min_bpm);
  print_optional_bpm("max", p.heart_rate.max_bpm);
  std::cout << "\n";
  std::cout << "  profiles available: " << b.profiles.by_id.size() << "\n\n";

  std::cout << "[BatchRuntime]" << (b.has_batch_runtime ? "" : " (defaults)") << "\n";
  std::cout << "  max_files=" << b.batch_runtime.max_files
            << " max_file_bytes=" << b.batch_runtime.max_file_bytes << "\n";
  std::cout << "  job_ttl_s=" << b.batch_runtime.job_ttl_s
            << " sweep_interval_s=" << b.batch_runtime.sweep_interval_s
            << " progress_pacing_ms=" << b.batch_runtime.progress_pacing_ms << "\n\n";

  std::cout << "[Diagnostics]\n";
  std::cout << "  verbose=" << (b.system.diagnostics.verbose ? "true" : "false")
            << " print_run_summaries=" << (b.system.diagnostics.print_run_summaries ? "true" : "false")
            << " print_exclusion_counts=" << (b.system.diagnostics.print_exclusion_counts ? "true" : "false")
            << "\n";
}

int main(int argc, char** argv) {
  std::string system_xml = "config/system.xml";
  std::string xsd_dir = ""; // e.g., "config/schemas"
  std::string profile = "";

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      system_xml = argv[++i];
    } else if (a == "--xsd-dir" && i + 1 < argc) {
      xsd_dir = argv[++i];
    } else if (a == "--profile" && i + 1 < argc) {
      profile = argv[++i];
    } else if (a == "--help" || a == "-h") {
      std::cout << "Usage: gradepace_config_check [--config <system.xml>] [--xsd-dir <dir>] [--profile <id>]\n";
      return 0;
    }
  }

  try {
    cfg::ConfigBundle bundle = cfg::ConfigLoader::Load(system_xml, xsd_dir, profile);
    print_bundle(bundle);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Config load failed: " << e.what() << "\n";
    return 2;
  }
}
