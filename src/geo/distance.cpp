#include "idw/geo/distance.hpp"
#include "idw/common.hpp"
#include <algorithm>
#include <cmath>

namespace idw
{
namespace geo
{

double haversine(const LatLng& a, const LatLng& b)
{
  const double lat1 = a.lat * DEG_TO_RAD;
  const double lat2 = b.lat * DEG_TO_RAD;
  const double d_lat = (b.lat - a.lat) * DEG_TO_RAD;
  const double d_lng = (b.lng - a.lng) * DEG_TO_RAD;

  const double sin_dlat = std::sin(d_lat / 2.0);
  const double sin_dlng = std::sin(d_lng / 2.0);

  double h = sin_dlat * sin_dlat +
             std::cos(lat1) * std::cos(lat2) * sin_dlng * sin_dlng;
  // Rounding can push h just outside [0, 1] for antipodal points.
  h = std::min(1.0, std::max(0.0, h));

  return EARTH_RADIUS_M * 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

double batchHaversine(const LatLng& query, const SamplePoint* samples,
                      size_t count, double* distances)
{
  double min_dist = INFINITY_D;

  for (size_t i = 0; i < count; ++i)
  {
    distances[i] = haversine(query, samples[i].location());
    min_dist = std::min(min_dist, distances[i]);
  }

  return min_dist;
}

}
}
