#include "gradepace/io/activity_reader.h"

#include "gradepace/common/geo_utilities/geodesy.h"
#include "gradepace/config/path_utils.h"
#include "gradepace/io/fit_reader.h"
#include "gradepace/io/gpx_reader.h"

#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>

namespace gradepace::io {

Activity ReadActivity(const ActivityFile& file) {
  const std::string ext = cfg::pathu::LowerExtension(file.filename);
  if (ext == ".gpx") return ReadGpx(file.bytes, file.filename);
  if (ext == ".fit") return ReadFit(file.bytes, file.filename);
  throw ActivityReadError("Unsupported file type. Only GPX and FIT files are supported.");
}

ActivityFile LoadActivityFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open activity file: " + path);
  }
  ActivityFile f;
  f.filename = cfg::pathu::Basename(path);
  f.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw std::runtime_error("Failed to read activity file: " + path);
  }
  return f;
}

ActivityInfo SummarizeActivity(const Activity& activity) {
  const PointSequence& pts = activity.points;

  ActivityInfo info;
  info.filename = activity.filename;
  info.file_type = activity.file_type;
  info.point_count = pts.size();
  info.total_time_s = geo::ElapsedTimeS(pts);
  info.distance_km = geo::PathLengthM(pts) / 1000.0;
  info.elevation_gain_m = std::round(geo::ElevationGainM(pts));
  if (!pts.empty()) {
    info.start_time_s = pts.front().time_s;
    info.end_time_s = pts.back().time_s;
  }

  if (!activity.session) return info;
  const SessionInfo& s = *activity.session;

  if (s.total_timer_time_s && *s.total_timer_time_s > 0.0) info.total_time_s = *s.total_timer_time_s;
  if (s.total_distance_m && *s.total_distance_m > 0.0) info.distance_km = *s.total_distance_m / 1000.0;
  if (s.total_ascent_m && *s.total_ascent_m > 0.0) info.elevation_gain_m = *s.total_ascent_m;
  if (!info.start_time_s) info.start_time_s = s.start_time_s;

  info.avg_heart_rate_bpm = s.avg_heart_rate_bpm;
  info.max_heart_rate_bpm = s.max_heart_rate_bpm;
  info.avg_cadence_rpm = s.avg_cadence_rpm;
  info.calories = s.total_calories;
  if (!s.sport.empty()) info.sport = s.sport;
  if (s.avg_speed_mps) info.avg_speed_kmh = *s.avg_speed_mps * 3.6;
  if (s.max_speed_mps) info.max_speed_kmh = *s.max_speed_mps * 3.6;
  return info;
}

} // namespace gradepace::io
