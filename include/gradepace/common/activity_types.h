#pragma once
/**
 * @file activity_types.h
 * @brief Normalized activity schema shared by every reader and the binning engine.
 *
 * Conventions:
 *  - Angles in degrees, elevations in meters, speeds in m/s.
 *  - Instants are seconds since the Unix epoch (UTC) held in a double.
 *  - Fields a source format may omit are std::optional; nothing is coerced to 0.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gradepace {

struct Point {
  double lat = 0.0;
  double lon = 0.0;
  double elevation_m = 0.0;
  std::optional<double> time_s;
  std::optional<int> heart_rate_bpm;
  std::optional<int> cadence_rpm;
  std::optional<double> speed_mps;
};

using PointSequence = std::vector<Point>;

enum class ActivityFileType {
  GPX,
  FIT
};

inline const char* ActivityFileTypeText(ActivityFileType t) {
  return (t == ActivityFileType::FIT) ? "FIT" : "GPX";
}

// Device-recorded session totals (FIT session message). Every field is optional
// because devices populate different subsets.
struct SessionInfo {
  std::optional<double> start_time_s;
  std::optional<double> total_timer_time_s;
  std::optional<double> total_distance_m;
  std::optional<double> total_ascent_m;
  std::optional<int> avg_heart_rate_bpm;
  std::optional<int> max_heart_rate_bpm;
  std::optional<int> avg_cadence_rpm;
  std::optional<int> total_calories;
  std::optional<double> avg_speed_mps;
  std::optional<double> max_speed_mps;
  std::string sport;
};

// Output of a format adapter: one intermediate shape regardless of the source.
struct Activity {
  std::string filename;
  ActivityFileType file_type = ActivityFileType::GPX;
  PointSequence points;
  std::optional<SessionInfo> session;
};

// Per-file statistics reported alongside the bins.
struct ActivityInfo {
  std::string filename;
  ActivityFileType file_type = ActivityFileType::GPX;
  double total_time_s = 0.0;
  double distance_km = 0.0;
  double elevation_gain_m = 0.0;
  std::size_t point_count = 0;
  std::optional<double> start_time_s;
  std::optional<double> end_time_s;

  std::optional<int> avg_heart_rate_bpm;
  std::optional<int> max_heart_rate_bpm;
  std::optional<int> avg_cadence_rpm;
  std::optional<int> calories;
  std::string sport = "unknown";
  std::optional<double> avg_speed_kmh;
  std::optional<double> max_speed_kmh;
};

// Raw input handed to the batch layer: a name (used for format dispatch) and its bytes.
struct ActivityFile {
  std::string filename;
  std::string bytes;
};

} // namespace gradepace
