/**
 * @file main.cpp
 * @brief Command-line driver: batch-process activity files, filter bins, analyze pace vs gradient.
 *
 * Pipeline:
 *  - Load configuration (system.xml + referenced profiles) or fall back to built-in defaults.
 *  - Read + bin every file in order (synchronously, or through the job coordinator with --async).
 *  - Apply the reliability / heart-rate filter and run the cross-run analyzer.
 *  - Print summaries; optionally export CSV reports.
 */

#include "gradepace/api/analysis_engine.h"
#include "gradepace/batch/job_coordinator.h"
#include "gradepace/config/config_loader.h"
#include "gradepace/io/activity_reader.h"
#include "gradepace/io/csv_report.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace gradepace;

const std::set<std::string> kValueFlags = {
  "--config", "--xsd-dir", "--profile", "--bin-length", "--hr-min", "--hr-max", "--output-dir"
};

std::string arg_value(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == key && i + 1 < argc) {
      return std::string(argv[i + 1]);
    }
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == key) return true;
  }
  return false;
}

double arg_double(int argc, char** argv, const std::string& key, double def) {
  const std::string s = arg_value(argc, argv, key, "");
  if (s.empty()) return def;
  return std::stod(s);
}

std::optional<int> arg_opt_int(int argc, char** argv, const std::string& key) {
  const std::string s = arg_value(argc, argv, key, "");
  if (s.empty()) return std::nullopt;
  return std::stoi(s);
}

std::vector<std::string> positional_args(int argc, char** argv) {
  std::vector<std::string> out;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (kValueFlags.count(a)) {
      ++i;
      continue;
    }
    if (a.rfind("--", 0) == 0) continue;
    out.push_back(a);
  }
  return out;
}

void print_usage() {
  std::cout << "Usage: gradepace [--config <system.xml>] [--xsd-dir <dir>] [--profile <id>]\n"
               "                 [--bin-length <m>] [--filter-unreliable] [--hr-min <bpm>] [--hr-max <bpm>]\n"
               "                 [--output-dir <dir>] [--async] [--verbose] <file.gpx|file.fit>...\n";
}

void print_progress(const batch::BatchEvent& ev) {
  std::cout << "[" << std::setw(3) << ev.percent << "%] " << ev.processed << "/" << ev.total
            << " " << ev.current_file
            << " (ok=" << ev.results.size() << " failed=" << ev.errors.size() << ")\n";
}

void print_run(const RunResult& r) {
  const ActivityInfo& info = r.info;
  std::cout << "  " << info.filename << " [" << ActivityFileTypeText(info.file_type) << "]"
            << " points=" << r.route_point_count
            << " distance_km=" << std::fixed << std::setprecision(2) << info.distance_km
            << " time=" << io::FormatDuration(info.total_time_s)
            << " gain_m=" << std::setprecision(0) << info.elevation_gain_m
            << " bins=" << r.bins.size();
  if (r.summary) {
    const RunSummary& s = *r.summary;
    std::cout << " avg_pace=" << (s.avg_pace_min_per_km ? io::FormatPace(*s.avg_pace_min_per_km) : "N/A");
    if (s.avg_heart_rate_bpm) {
      std::cout << " avg_hr=" << *s.avg_heart_rate_bpm
                << " hr_coverage=" << std::setprecision(2) << s.heart_rate_coverage;
    }
  }
  std::cout << "\n" << std::defaultfloat;
}

void print_batch_summary(const batch::BatchSummary& s) {
  std::cout << "\n=== Batch Summary ===\n";
  std::cout << "  files=" << s.total_files << " ok=" << s.successful_files << " failed=" << s.failed_files << "\n";
  std::cout << "  bin_length_m=" << s.bin_length_m << " total_bins=" << s.total_bins
            << " avg_bins_per_file=" << s.avg_bins_per_file
            << " files_with_hr=" << s.files_with_heart_rate << "\n";
}

void print_analysis(const api::AnalysisResponse& resp, bool print_exclusions) {
  if (resp.filtering && print_exclusions) {
    const auto& f = *resp.filtering;
    std::cout << "\n=== Reliability Filter ===\n";
    std::cout << "  bins " << f.original_bins << " -> " << f.filtered_bins
              << " (excluded " << f.counts.total << ": speed=" << f.counts.speed
              << " gradient=" << f.counts.gradient << " duration=" << f.counts.duration
              << " distance=" << f.counts.distance << " heart_rate=" << f.counts.heart_rate << ")\n";
  }

  const stats::GradientPaceReport& r = resp.report;
  std::cout << "\n=== Pace by Gradient Range (" << r.range_buckets.total_bins << " bins) ===\n";
  for (const auto& b : r.range_buckets.buckets) {
    std::cout << "  " << std::left << std::setw(12) << b.label << std::right
              << " bins=" << std::setw(5) << b.bin_count
              << " mean=" << io::FormatPace(b.mean_pace)
              << " median=" << io::FormatPace(b.median_pace);
    if (b.mean_heart_rate) {
      std::cout << " hr=" << std::fixed << std::setprecision(0) << *b.mean_heart_rate << std::defaultfloat;
    }
    std::cout << "\n";
  }

  const auto& ga = r.grade_adjustment;
  std::cout << "\n=== Grade Adjustment (base pace "
            << (ga.base_pace ? io::FormatPace(*ga.base_pace) : std::string("N/A")) << ") ===\n";
  for (const auto& e : ga.entries) {
    std::cout << "  " << std::setw(6) << e.key.Label() << "%"
              << " bins=" << std::setw(5) << e.bin_count
              << " pace=" << io::FormatPace(e.pace_min_per_km)
              << std::fixed << std::setprecision(3)
              << " personal=" << e.personal_factor
              << " literature=" << e.literature_factor << std::defaultfloat << "\n";
  }

  if (r.personal_model) {
    const auto& c = *r.personal_model;
    std::cout << "\nPersonal grade model: factor(g) = " << std::scientific << std::setprecision(4)
              << c.a << " g^4 + " << c.b << " g^3 + " << c.c << " g^2 + " << c.d << " g + " << c.e
              << std::defaultfloat << "\n";
  } else {
    std::cout << "\nPersonal grade model: not enough distinct gradients\n";
  }
}

// Streams progress through the coordinator and returns the terminal report.
batch::BatchReport run_async(const api::AnalysisEngine& engine,
                             std::vector<ActivityFile> files,
                             bool verbose) {
  batch::JobCoordinator jobs(batch::MakeCoordinatorConfig(engine.config().batch_runtime, verbose));
  const std::string id = jobs.Submit(std::move(files), engine.MakeBatchOptions(verbose));
  std::cout << "Job " << id << " submitted\n";

  auto stream = jobs.Subscribe(id);
  batch::BatchReport report;
  bool terminal = false;
  while (!terminal && !stream->Drained()) {
    auto ev = stream->Next(std::chrono::milliseconds(500));
    if (!ev) continue;
    switch (ev->kind) {
      case batch::EventKind::Progress:
        print_progress(*ev);
        break;
      case batch::EventKind::Complete:
        for (const auto& r : ev->results) report.results.push_back(*r);
        report.errors = ev->errors;
        if (ev->summary) report.summary = *ev->summary;
        terminal = true;
        break;
      case batch::EventKind::Error:
        throw std::invalid_argument(ev->message);
    }
  }
  if (!terminal) {
    throw std::runtime_error("Job " + id + " ended without a terminal event");
  }
  return report;
}

} // namespace

int main(int argc, char** argv) try {
  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage();
    return 0;
  }

  const std::string system_xml = arg_value(argc, argv, "--config", "");
  const std::string xsd_dir    = arg_value(argc, argv, "--xsd-dir", "");
  const std::string profile    = arg_value(argc, argv, "--profile", "");
  const std::string output_dir = arg_value(argc, argv, "--output-dir", "");
  const bool use_async         = has_flag(argc, argv, "--async");

  const std::vector<std::string> paths = positional_args(argc, argv);
  if (paths.empty()) {
    print_usage();
    return 2;
  }

  api::AnalysisEngine engine;
  if (system_xml.empty()) {
    if (!profile.empty()) {
      std::cerr << "WARNING: --profile ignored without --config\n";
    }
    engine.Initialize(cfg::ConfigLoader::Defaults());
  } else {
    engine.Initialize(system_xml, xsd_dir, profile);
  }
  engine.SetBinLength(arg_double(argc, argv, "--bin-length", engine.config().analysis.bin_length_m));

  const cfg::DiagnosticsCfg& diag = engine.config().system.diagnostics;
  const bool verbose = has_flag(argc, argv, "--verbose") || diag.verbose;

  if (verbose) {
    std::cout << "Config:  " << (system_xml.empty() ? std::string("(built-in defaults)") : system_xml) << "\n";
    std::cout << "Profile: " << engine.config().analysis.id
              << " bin_length_m=" << engine.config().analysis.bin_length_m
              << " grade_model=" << engine.grade_model().Name() << "\n";
  }

  std::vector<ActivityFile> files;
  files.reserve(paths.size());
  for (const auto& p : paths) {
    files.push_back(io::LoadActivityFile(p));
  }

  batch::BatchReport report = use_async
      ? run_async(engine, std::move(files), verbose)
      : engine.ProcessBatch(files, [](const batch::BatchEvent& ev) { print_progress(ev); });

  for (const auto& e : report.errors) {
    std::cerr << "ERROR: " << e.filename << ": " << e.message << "\n";
  }
  if (diag.print_run_summaries) {
    std::cout << "\n=== Runs ===\n";
    for (const auto& r : report.results) print_run(r);
  }
  print_batch_summary(report.summary);

  api::AnalysisRequest req;
  req.runs = report.results;
  if (has_flag(argc, argv, "--filter-unreliable")) req.filter_unreliable = true;
  const auto hr_min = arg_opt_int(argc, argv, "--hr-min");
  const auto hr_max = arg_opt_int(argc, argv, "--hr-max");
  if (hr_min || hr_max) req.heart_rate = filter::HeartRateRange{hr_min, hr_max};

  const api::AnalysisResponse resp = engine.Analyze(req);
  print_analysis(resp, diag.print_exclusion_counts);

  if (!output_dir.empty()) {
    const std::vector<RunResult>& runs = resp.filtering ? resp.filtering->runs : *req.runs;
    io::WriteReports(output_dir, runs, resp.report);
    std::cout << "\nReports written to " << output_dir << "\n";
  }

  return report.results.empty() ? 3 : 0;
} catch (const std::invalid_argument& e) {
  std::cerr << "ERROR: " << e.what() << "\n";
  return 2;
} catch (const std::exception& e) {
  std::cerr << "FATAL: " << e.what() << "\n";
  return 1;
}
