#ifndef IDW_RASTER_RENDER_REQUEST_HPP_
#define IDW_RASTER_RENDER_REQUEST_HPP_

#include "idw/config.hpp"
#include "idw/geo/types.hpp"
#include "idw/color/gradient.hpp"

namespace idw
{
namespace raster
{

struct RenderRequest
{
  geo::SampleSet points;
  geo::BoundingBox bounds;
  color::GradientSpec gradient;
  RasterConfig config;
};

}
}

#endif
