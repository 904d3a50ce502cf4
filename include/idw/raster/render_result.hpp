#ifndef IDW_RASTER_RENDER_RESULT_HPP_
#define IDW_RASTER_RENDER_RESULT_HPP_

#include "idw/common.hpp"
#include "idw/raster/raster_image.hpp"
#include <cstddef>
#include <string>

namespace idw
{
namespace raster
{

struct RenderResult
{
  RasterImage image;

  Status status = Status::FAILURE;
  ErrorKind error = ErrorKind::NONE;
  std::string error_message;

  size_t cells_computed = 0;
  size_t cells_faded = 0;
  size_t distance_evaluations = 0;
  double computation_time_ms = 0.0;

  bool isSuccess() const
  {
    return status == Status::SUCCESS && image.isValid();
  }

  void fail(ErrorKind kind, const std::string& message)
  {
    status = Status::FAILURE;
    error = kind;
    error_message = message;
  }
};

}
}

#endif
