#pragma once

#include "gradepace/common/activity_types.h"

#include <cstddef>

namespace gradepace::geo {

constexpr double kEarthRadiusM = 6371000.0;

// Great-circle distance in meters (haversine). Returns 0 when any coordinate is not finite.
double HaversineM(double lat1_deg, double lon1_deg, double lat2_deg, double lon2_deg);

// Segment distance between two points with the same non-finite rule as HaversineM.
double SegmentDistanceM(const Point& a, const Point& b);

// Sum of consecutive segment distances (meters).
double PathLengthM(const PointSequence& points);

// Sum of positive elevation deltas between consecutive points (meters, unrounded).
double ElevationGainM(const PointSequence& points);

// last.time - first.time in seconds; 0 when either end has no timestamp.
double ElapsedTimeS(const PointSequence& points);

} // namespace gradepace::geo
