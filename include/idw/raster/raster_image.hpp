#ifndef IDW_RASTER_RASTER_IMAGE_HPP_
#define IDW_RASTER_RASTER_IMAGE_HPP_

#include "idw/color/gradient.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace idw
{
namespace raster
{

// Row-major RGBA8 pixel buffer, origin at the top-left (north-west) corner.
struct RasterImage
{
  static constexpr int CHANNELS = 4;

  int width = 0;
  int height = 0;
  std::vector<uint8_t> data;

  void allocate(int w, int h)
  {
    width = w;
    height = h;
    data.assign(static_cast<size_t>(w) * static_cast<size_t>(h) * CHANNELS, 0);
  }

  bool isValid() const
  {
    return width > 0 && height > 0 &&
           data.size() == static_cast<size_t>(width) * static_cast<size_t>(height) * CHANNELS;
  }

  size_t pixelOffset(int x, int y) const
  {
    return (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * CHANNELS;
  }

  const uint8_t* pixel(int x, int y) const
  {
    return data.data() + pixelOffset(x, y);
  }

  void setPixel(int x, int y, const color::Rgb& rgb, uint8_t alpha)
  {
    uint8_t* p = data.data() + pixelOffset(x, y);
    p[0] = rgb[0];
    p[1] = rgb[1];
    p[2] = rgb[2];
    p[3] = alpha;
  }

  color::Rgb rgbAt(int x, int y) const
  {
    const uint8_t* p = pixel(x, y);
    return color::Rgb(p[0], p[1], p[2]);
  }

  uint8_t alphaAt(int x, int y) const
  {
    return pixel(x, y)[3];
  }
};

}
}

#endif
