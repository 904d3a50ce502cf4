#ifndef IDW_COLOR_GRADIENT_HPP_
#define IDW_COLOR_GRADIENT_HPP_

#include "idw/common.hpp"
#include <Eigen/Core>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace idw
{
namespace color
{

using Rgb = Eigen::Matrix<uint8_t, 3, 1>;

struct GradientStop
{
  double position;
  Rgb color;
};

// Stops in declaration order. Positions must lie in [0, 1]; when two stops
// share a position the one declared last wins.
using GradientSpec = std::vector<GradientStop>;

/**
 * Dense 256-entry color ramp derived from a GradientSpec by piecewise-linear
 * RGB interpolation. Entry 0 doubles as the background color for feathering.
 */
class GradientLookup
{
public:
  GradientLookup();

  static bool build(const GradientSpec& spec,
                    GradientLookup& lookup,
                    std::string& error_message);

  const Rgb& operator[](int index) const
  {
    return table_[index];
  }

  const Rgb& background() const
  {
    return table_[0];
  }

  static constexpr int size()
  {
    return GRADIENT_LOOKUP_SIZE;
  }

private:
  std::array<Rgb, GRADIENT_LOOKUP_SIZE> table_;
};

// Sorted, de-duplicated copy of spec. Returns false on an empty spec or a
// stop outside [0, 1].
bool normalizeStops(const GradientSpec& spec,
                    GradientSpec& sorted,
                    std::string& error_message);

}
}

#endif
