#ifndef IDW_COMMON_HPP_
#define IDW_COMMON_HPP_

#include <cstdint>
#include <limits>

namespace idw
{

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

constexpr double EARTH_RADIUS_M = 6371000.0;
constexpr double MERCATOR_MAX_LATITUDE = 85.0511287798;

constexpr double WEIGHT_EPS = 1e-6;
constexpr double INFINITY_D = std::numeric_limits<double>::infinity();

constexpr int GRADIENT_LOOKUP_SIZE = 256;
constexpr int MAX_RASTER_DIMENSION = 32768;

enum class Status
{
  SUCCESS = 0,
  FAILURE
};

enum class ErrorKind
{
  NONE = 0,
  INVALID_DIMENSIONS,
  INVALID_BOUNDING_BOX,
  EMPTY_POINT_SET,
  INVALID_GRADIENT,
  INVALID_EXPONENT,
  INVALID_SAMPLE,
  INVALID_PARAMETER,
  INVALID_REQUEST,
  ENCODING_FAILED
};

const char* errorKindToString(ErrorKind kind);

}

#endif
