#include "idw/config.hpp"

namespace idw
{

RasterConfig makeRasterConfig(RenderMode mode)
{
  RasterConfig config;

  switch (mode)
  {
    case RenderMode::FINE:
      config.cell_size = 1;
      config.feathering = false;
      config.prefill_background = false;
      break;
    case RenderMode::FEATHERED:
      config.cell_size = 10;
      config.feathering = true;
      config.prefill_background = true;
      break;
  }

  return config;
}

}
