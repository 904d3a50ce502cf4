#ifndef IDW_GEO_DISTANCE_HPP_
#define IDW_GEO_DISTANCE_HPP_

#include "idw/geo/types.hpp"
#include <cstddef>

namespace idw
{
namespace geo
{

// Great-circle distance in meters on a sphere of radius EARTH_RADIUS_M.
double haversine(const LatLng& a, const LatLng& b);

// Fills distances[i] with haversine(query, samples[i]) and returns the smallest.
double batchHaversine(const LatLng& query, const SamplePoint* samples,
                      size_t count, double* distances);

}
}

#endif
