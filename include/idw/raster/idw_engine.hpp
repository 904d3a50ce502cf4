#ifndef IDW_RASTER_IDW_ENGINE_HPP_
#define IDW_RASTER_IDW_ENGINE_HPP_

#include "idw/raster/render_request.hpp"
#include "idw/raster/render_result.hpp"
#include <memory>
#include <string>
#include <vector>

namespace idw
{
namespace raster
{

struct CellEstimate
{
  double value = 0.0;
  double min_distance = INFINITY_D;
  int gradient_index = 0;
  double alpha = 1.0;
};

CellEstimate estimateAt(const geo::LatLng& location,
                        const geo::SampleSet& points,
                        const RasterConfig& config,
                        std::vector<double>& distances);

int gradientIndex(double value, double max_value);

double featherAlpha(double min_distance, double fade_distance);

class IDWEngine
{
public:
  IDWEngine();
  ~IDWEngine();

  RenderResult render(const RenderRequest& request) const;

  bool validate(const RenderRequest& request, ErrorKind& kind,
                std::string& error_message) const;

private:
  struct Implementation;
  std::unique_ptr<Implementation> impl_;
};

}
}

#endif
