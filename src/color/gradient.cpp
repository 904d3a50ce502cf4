#include "idw/color/gradient.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace idw
{
namespace color
{

namespace
{

Rgb lerpColor(const Rgb& c0, const Rgb& c1, double f)
{
  Eigen::Vector3d mixed = c0.cast<double>() + (c1.cast<double>() - c0.cast<double>()) * f;

  Rgb result;
  for (int i = 0; i < 3; ++i)
  {
    long channel = std::lround(mixed[i]);
    result[i] = static_cast<uint8_t>(std::max(0L, std::min(255L, channel)));
  }
  return result;
}

}

GradientLookup::GradientLookup()
{
  table_.fill(Rgb::Zero());
}

bool normalizeStops(const GradientSpec& spec,
                    GradientSpec& sorted,
                    std::string& error_message)
{
  if (spec.empty())
  {
    error_message = "Gradient must have at least one stop";
    return false;
  }

  for (const auto& stop : spec)
  {
    if (!std::isfinite(stop.position) || stop.position < 0.0 || stop.position > 1.0)
    {
      error_message = "Gradient stop " + std::to_string(stop.position) +
                      " is outside [0, 1]";
      return false;
    }
  }

  sorted = spec;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const GradientStop& a, const GradientStop& b)
                   {
                     return a.position < b.position;
                   });

  GradientSpec unique;
  unique.reserve(sorted.size());
  for (const auto& stop : sorted)
  {
    if (!unique.empty() && unique.back().position == stop.position)
    {
      spdlog::warn("Duplicate gradient stop at {}, keeping the last declared color",
                   stop.position);
      unique.back() = stop;
    }
    else
    {
      unique.push_back(stop);
    }
  }

  sorted = std::move(unique);
  return true;
}

bool GradientLookup::build(const GradientSpec& spec,
                           GradientLookup& lookup,
                           std::string& error_message)
{
  GradientSpec stops;
  if (!normalizeStops(spec, stops, error_message))
  {
    return false;
  }

  for (int i = 0; i < GRADIENT_LOOKUP_SIZE; ++i)
  {
    const double t = static_cast<double>(i) / (GRADIENT_LOOKUP_SIZE - 1);

    auto it = std::lower_bound(stops.begin(), stops.end(), t,
                               [](const GradientStop& stop, double value)
                               {
                                 return stop.position < value;
                               });

    if (it == stops.end())
    {
      lookup.table_[i] = stops.back().color;
    }
    else if (it == stops.begin())
    {
      lookup.table_[i] = it->color;
    }
    else
    {
      const GradientStop& lo = *(it - 1);
      const GradientStop& hi = *it;
      const double f = (t - lo.position) / (hi.position - lo.position);
      lookup.table_[i] = lerpColor(lo.color, hi.color, f);
    }
  }

  spdlog::debug("Built gradient lookup from {} stops", stops.size());
  return true;
}

}
}
