#ifndef IDW_GEO_TYPES_HPP_
#define IDW_GEO_TYPES_HPP_

#include <cmath>
#include <vector>

namespace idw
{
namespace geo
{

struct LatLng
{
  double lat = 0.0;
  double lng = 0.0;

  bool isFinite() const
  {
    return std::isfinite(lat) && std::isfinite(lng);
  }
};

struct SamplePoint
{
  double lat = 0.0;
  double lng = 0.0;
  double value = 0.0;

  LatLng location() const
  {
    return LatLng{lat, lng};
  }

  bool isFinite() const
  {
    return std::isfinite(lat) && std::isfinite(lng) && std::isfinite(value);
  }
};

using SampleSet = std::vector<SamplePoint>;

// North-up extent: row 0 maps to max_lat, the last row to min_lat.
struct BoundingBox
{
  double min_lat = 0.0;
  double min_lng = 0.0;
  double max_lat = 0.0;
  double max_lng = 0.0;

  bool isFinite() const
  {
    return std::isfinite(min_lat) && std::isfinite(min_lng) &&
           std::isfinite(max_lat) && std::isfinite(max_lng);
  }

  // Poles are excluded, Mercator Y diverges there.
  bool isValid() const
  {
    return isFinite() &&
           min_lat < max_lat && min_lng < max_lng &&
           min_lat > -90.0 && max_lat < 90.0;
  }

  bool contains(const LatLng& point) const
  {
    return point.lat >= min_lat && point.lat <= max_lat &&
           point.lng >= min_lng && point.lng <= max_lng;
  }

  double latSpan() const
  {
    return max_lat - min_lat;
  }

  double lngSpan() const
  {
    return max_lng - min_lng;
  }
};

}
}

#endif
