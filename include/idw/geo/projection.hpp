#ifndef IDW_GEO_PROJECTION_HPP_
#define IDW_GEO_PROJECTION_HPP_

#include "idw/geo/types.hpp"

namespace idw
{
namespace geo
{

double latitudeToMercator(double lat_deg);

double mercatorToLatitude(double merc_y);

// y = 0 is the north edge.
LatLng pixelToLatLng(double x, double y, int width, int height,
                     const BoundingBox& bounds);

void latLngToPixel(const LatLng& point, int width, int height,
                   const BoundingBox& bounds, double& out_x, double& out_y);

}
}

#endif
