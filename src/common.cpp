#include "idw/common.hpp"

namespace idw
{

const char* errorKindToString(ErrorKind kind)
{
  switch (kind)
  {
    case ErrorKind::NONE:
      return "None";
    case ErrorKind::INVALID_DIMENSIONS:
      return "InvalidDimensions";
    case ErrorKind::INVALID_BOUNDING_BOX:
      return "InvalidBoundingBox";
    case ErrorKind::EMPTY_POINT_SET:
      return "EmptyPointSet";
    case ErrorKind::INVALID_GRADIENT:
      return "InvalidGradient";
    case ErrorKind::INVALID_EXPONENT:
      return "InvalidExponent";
    case ErrorKind::INVALID_SAMPLE:
      return "InvalidSample";
    case ErrorKind::INVALID_PARAMETER:
      return "InvalidParameter";
    case ErrorKind::INVALID_REQUEST:
      return "InvalidRequest";
    case ErrorKind::ENCODING_FAILED:
      return "EncodingFailed";
  }
  return "Unknown";
}

}
