#include "gradepace/common/geo_utilities/geodesy.h"

#include <cmath>

namespace gradepace::geo {
namespace {

constexpr double kPi = 3.14159265358979323846;

inline double deg_to_rad(double d) { return d * kPi / 180.0; }

} // namespace

double HaversineM(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg) {
  if (!std::isfinite(lat1_deg) || !std::isfinite(lon1_deg) ||
      !std::isfinite(lat2_deg) || !std::isfinite(lon2_deg)) {
    return 0.0;
  }

  const double d_lat = deg_to_rad(lat2_deg - lat1_deg);
  const double d_lon = deg_to_rad(lon2_deg - lon1_deg);
  const double s_lat = std::sin(d_lat / 2.0);
  const double s_lon = std::sin(d_lon / 2.0);

  const double a = s_lat * s_lat +
                   std::cos(deg_to_rad(lat1_deg)) * std::cos(deg_to_rad(lat2_deg)) * s_lon * s_lon;
  const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
  return kEarthRadiusM * c;
}

double SegmentDistanceM(const Point& a, const Point& b) {
  return HaversineM(a.lat, a.lon, b.lat, b.lon);
}

double PathLengthM(const PointSequence& points) {
  long double acc = 0.0L;
  for (std::size_t i = 1; i < points.size(); ++i) {
    acc += static_cast<long double>(SegmentDistanceM(points[i - 1], points[i]));
  }
  return static_cast<double>(acc);
}

double ElevationGainM(const PointSequence& points) {
  double gain = 0.0;
  for (std::size_t i = 1; i < points.size(); ++i) {
    const double prev = points[i - 1].elevation_m;
    const double curr = points[i].elevation_m;
    if (!std::isfinite(prev) || !std::isfinite(curr)) continue;
    const double diff = curr - prev;
    if (diff > 0.0) gain += diff;
  }
  return gain;
}

double ElapsedTimeS(const PointSequence& points) {
  if (points.empty()) return 0.0;
  const auto& first = points.front().time_s;
  const auto& last = points.back().time_s;
  if (!first || !last) return 0.0;
  const double dt = *last - *first;
  return std::isfinite(dt) ? dt : 0.0;
}

} // namespace gradepace::geo
