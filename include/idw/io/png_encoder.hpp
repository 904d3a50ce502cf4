#ifndef IDW_IO_PNG_ENCODER_HPP_
#define IDW_IO_PNG_ENCODER_HPP_

#include "idw/common.hpp"
#include "idw/raster/raster_image.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace idw
{
namespace io
{

bool encodePNG(const raster::RasterImage& image,
               std::vector<uint8_t>& bytes,
               ErrorKind& kind,
               std::string& error_message);

bool writePNG(const raster::RasterImage& image,
              const std::string& output_file,
              ErrorKind& kind,
              std::string& error_message);

}
}

#endif
