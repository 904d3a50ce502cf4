#ifndef IDW_CONFIG_HPP_
#define IDW_CONFIG_HPP_

#include "idw/common.hpp"
#include <cstdint>

namespace idw
{

enum class RenderMode : uint8_t
{
  FINE = 0,
  FEATHERED = 1
};

struct RasterConfig
{
  int width = 0;
  int height = 0;
  int cell_size = 10;

  double max_value = 1.0;
  double exponent = 2.0;
  double epsilon = WEIGHT_EPS;

  bool feathering = true;
  double fade_distance = 100000.0;

  bool prefill_background = true;
  bool parallel = true;
};

RasterConfig makeRasterConfig(RenderMode mode);

}

#endif
