#include "gradepace/io/csv_report.h"

#include "gradepace/config/path_utils.h"
#include "gradepace/io/iso_time.h"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <stdexcept>

namespace gradepace::io {
namespace {

std::ofstream open_or_throw(const std::string& path) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to open for writing: " + path);
  }
  out << std::fixed;
  return out;
}

void close_or_throw(std::ofstream& out, const std::string& path) {
  out.close();
  if (!out) {
    throw std::runtime_error("Failed to write: " + path);
  }
}

// Quotes fields holding separators, quotes or line breaks.
std::string csv_field(const std::string& s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
  std::string q = "\"";
  for (char c : s) {
    if (c == '"') q += '"';
    q += c;
  }
  q += '"';
  return q;
}

template <typename T>
void put_opt(std::ostream& os, const std::optional<T>& v, int precision) {
  if (!v) return;
  os << std::setprecision(precision) << *v;
}

void put_opt(std::ostream& os, const std::optional<int>& v) {
  if (v) os << *v;
}

} // namespace

std::string FormatPace(double min_per_km) {
  if (!std::isfinite(min_per_km) || min_per_km <= 0.0) return "N/A";
  const long long total_s = std::llround(min_per_km * 60.0);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%lld:%02lld", total_s / 60, total_s % 60);
  return buf;
}

std::string FormatDuration(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0.0) seconds = 0.0;
  const long long t = static_cast<long long>(std::floor(seconds));
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", t / 3600, (t % 3600) / 60, t % 60);
  return buf;
}

void WriteBinsCsv(const std::string& path, const std::vector<RunResult>& runs) {
  std::ofstream out = open_or_throw(path);
  out << "file,bin,start_index,end_index,distance_m,elevation_change_m,gradient_pct,"
         "duration_s,velocity_mps,pace_min_per_km,pace,adjusted_duration_s,"
         "grade_adjusted_distance_m,start_time,end_time,avg_hr,max_hr,min_hr,hr_samples,avg_speed_kmh\n";
  for (const RunResult& r : runs) {
    for (std::size_t i = 0; i < r.bins.size(); ++i) {
      const Bin& b = r.bins[i];
      out << csv_field(r.info.filename) << ',' << i << ',' << b.start_index << ',' << b.end_index << ','
          << std::setprecision(2) << b.distance_m << ','
          << b.elevation_change_m << ','
          << b.gradient_pct << ',';
      put_opt(out, b.duration_s, 1);
      out << ',';
      put_opt(out, b.velocity_mps, 3);
      out << ',';
      put_opt(out, b.pace_min_per_km, 3);
      out << ',' << (b.pace_min_per_km ? FormatPace(*b.pace_min_per_km) : std::string()) << ','
          << std::setprecision(1) << b.adjusted_duration_s << ',';
      put_opt(out, b.grade_adjusted_distance_m, 2);
      out << ',' << (b.start_time_s ? FormatIso8601(*b.start_time_s) : std::string())
          << ',' << (b.end_time_s ? FormatIso8601(*b.end_time_s) : std::string()) << ',';
      put_opt(out, b.avg_heart_rate_bpm);
      out << ',';
      put_opt(out, b.max_heart_rate_bpm);
      out << ',';
      put_opt(out, b.min_heart_rate_bpm);
      out << ',' << b.heart_rate_samples << ',';
      put_opt(out, b.avg_speed_kmh, 2);
      out << '\n';
    }
  }
  close_or_throw(out, path);
}

void WriteGradientBucketsCsv(const std::string& path, const stats::RangeBucketAnalysis& a) {
  std::ofstream out = open_or_throw(path);
  out << "range,bin_count,pace_samples,mean_pace_min_per_km,median_pace_min_per_km,"
         "mean_pace,median_pace,mean_hr,median_hr\n";
  for (const auto& b : a.buckets) {
    out << csv_field(b.label) << ',' << b.bin_count << ',' << b.pace_samples << ','
        << std::setprecision(3) << b.mean_pace << ',' << b.median_pace << ','
        << FormatPace(b.mean_pace) << ',' << FormatPace(b.median_pace) << ',';
    put_opt(out, b.mean_heart_rate, 1);
    out << ',';
    put_opt(out, b.median_heart_rate, 1);
    out << '\n';
  }
  close_or_throw(out, path);
}

void WritePaceByGradientCsv(const std::string& path, const std::vector<stats::PaceByGradientEntry>& chart) {
  std::ofstream out = open_or_throw(path);
  out << "gradient,bin_count,total_distance_m,total_time_s,pace_min_per_km,pace\n";
  for (const auto& e : chart) {
    out << csv_field(e.key.Label()) << ',' << e.bin_count << ','
        << std::setprecision(1) << e.total_distance_m << ',' << e.total_time_s << ','
        << std::setprecision(3) << e.pace_min_per_km << ',' << FormatPace(e.pace_min_per_km) << '\n';
  }
  close_or_throw(out, path);
}

void WriteGradeAdjustmentCsv(const std::string& path, const stats::GradeAdjustmentAnalysis& a) {
  std::ofstream out = open_or_throw(path);
  out << "gradient,gradient_value,bin_count,pace_min_per_km,personal_factor,literature_factor,base_pace\n";
  const std::string base = a.base_pace ? FormatPace(*a.base_pace) : std::string("N/A");
  for (const auto& e : a.entries) {
    out << csv_field(e.key.Label()) << ',' << std::setprecision(0) << e.gradient_value << ','
        << e.bin_count << ',' << std::setprecision(3) << e.pace_min_per_km << ','
        << std::setprecision(4) << e.personal_factor << ',' << e.literature_factor << ','
        << base << '\n';
  }
  close_or_throw(out, path);
}

void WriteAdjustmentViewCsv(const std::string& path, const stats::AdjustmentView& v) {
  std::ofstream out = open_or_throw(path);
  out << "gradient,statistic,bin_count,actual_ratio,expected_ratio,deviation\n";
  for (const auto& e : v.entries) {
    out << csv_field(e.key.Label()) << ',' << stats::StatisticText(v.statistic) << ','
        << e.bin_count << ',' << std::setprecision(4) << e.actual_ratio << ','
        << e.expected_ratio << ',' << e.deviation << '\n';
  }
  close_or_throw(out, path);
}

void WriteReports(const std::string& dir,
                  const std::vector<RunResult>& runs,
                  const stats::GradientPaceReport& report) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("Failed to create output directory " + dir + ": " + ec.message());
  }
  using cfg::pathu::Join;
  WriteBinsCsv(Join(dir, "bins.csv"), runs);
  WriteGradientBucketsCsv(Join(dir, "gradient_buckets.csv"), report.range_buckets);
  WritePaceByGradientCsv(Join(dir, "pace_by_gradient.csv"), report.per_degree);
  WriteGradeAdjustmentCsv(Join(dir, "grade_adjustment.csv"), report.grade_adjustment);
  WriteAdjustmentViewCsv(Join(dir, "adjustment_view.csv"), report.adjustment_view);
}

} // namespace gradepace::io
