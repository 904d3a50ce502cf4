#include "idw/geo/projection.hpp"
#include "idw/common.hpp"
#include <cmath>

namespace idw
{
namespace geo
{

double latitudeToMercator(double lat_deg)
{
  const double rad = lat_deg * DEG_TO_RAD;
  return std::log(std::tan(PI / 4.0 + rad / 2.0));
}

double mercatorToLatitude(double merc_y)
{
  return (2.0 * std::atan(std::exp(merc_y)) - PI / 2.0) * RAD_TO_DEG;
}

LatLng pixelToLatLng(double x, double y, int width, int height,
                     const BoundingBox& bounds)
{
  const double top_merc = latitudeToMercator(bounds.max_lat);
  const double bottom_merc = latitudeToMercator(bounds.min_lat);

  const double ty = y / static_cast<double>(height);
  const double merc_y = top_merc + ty * (bottom_merc - top_merc);

  const double tx = x / static_cast<double>(width);

  LatLng result;
  result.lat = mercatorToLatitude(merc_y);
  result.lng = bounds.min_lng + tx * bounds.lngSpan();
  return result;
}

void latLngToPixel(const LatLng& point, int width, int height,
                   const BoundingBox& bounds, double& out_x, double& out_y)
{
  const double top_merc = latitudeToMercator(bounds.max_lat);
  const double bottom_merc = latitudeToMercator(bounds.min_lat);

  const double merc_y = latitudeToMercator(point.lat);

  out_x = (point.lng - bounds.min_lng) / bounds.lngSpan() * width;
  out_y = (merc_y - top_merc) / (bottom_merc - top_merc) * height;
}

}
}
