#include "idw/io/request_parser.hpp"
#include "idw/color/color_parser.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <vector>

namespace idw
{
namespace io
{

namespace
{

using Json = nlohmann::ordered_json;

bool parseStopPosition(const std::string& key, double& position)
{
  const char* begin = key.c_str();
  char* end = nullptr;
  position = std::strtod(begin, &end);
  return end != begin && *end == '\0';
}

bool readInteger(const Json& document, const char* field, int& out, std::string& error_message)
{
  const Json& value = document.at(field);
  if (!value.is_number())
  {
    error_message = std::string("'") + field + "' must be a number";
    return false;
  }

  const double number = value.get<double>();
  if (!std::isfinite(number) || number != std::floor(number) ||
      std::abs(number) > 1e9)
  {
    error_message = std::string("'") + field + "' must be an integer";
    return false;
  }

  out = static_cast<int>(number);
  return true;
}

bool readNumber(const Json& document, const char* field, double& out, std::string& error_message)
{
  const Json& value = document.at(field);
  if (!value.is_number())
  {
    error_message = std::string("'") + field + "' must be a number";
    return false;
  }
  out = value.get<double>();
  return true;
}

bool parsePoints(const Json& points, geo::SampleSet& samples, std::string& error_message)
{
  if (!points.is_array())
  {
    error_message = "'points' must be an array of [lat, lng, value]";
    return false;
  }

  samples.clear();
  samples.reserve(points.size());

  for (size_t i = 0; i < points.size(); ++i)
  {
    const Json& p = points[i];
    if (!p.is_array() || p.size() < 3 ||
        !p[0].is_number() || !p[1].is_number() || !p[2].is_number())
    {
      error_message = "Point " + std::to_string(i) + " must be [lat, lng, value]";
      return false;
    }

    geo::SamplePoint sample;
    sample.lat = p[0].get<double>();
    sample.lng = p[1].get<double>();
    sample.value = p[2].get<double>();
    samples.push_back(sample);
  }

  return true;
}

bool parseBounds(const Json& bounds, geo::BoundingBox& box, std::string& error_message)
{
  if (!bounds.is_object())
  {
    error_message = "'bounds' must be an object";
    return false;
  }

  for (const char* field : {"minLat", "minLng", "maxLat", "maxLng"})
  {
    if (!bounds.contains(field))
    {
      error_message = std::string("'bounds' is missing '") + field + "'";
      return false;
    }
  }

  return readNumber(bounds, "minLat", box.min_lat, error_message) &&
         readNumber(bounds, "minLng", box.min_lng, error_message) &&
         readNumber(bounds, "maxLat", box.max_lat, error_message) &&
         readNumber(bounds, "maxLng", box.max_lng, error_message);
}

}

bool parseGradient(const Json& gradient,
                   color::GradientSpec& spec,
                   std::string& error_message)
{
  spec.clear();

  auto addStop = [&](double position, const Json& color_value) -> bool
  {
    if (!color_value.is_string())
    {
      error_message = "Gradient color at stop " + std::to_string(position) + " must be a string";
      return false;
    }

    color::Rgb rgb;
    if (!color::parseColor(color_value.get<std::string>(), rgb, error_message))
    {
      return false;
    }

    spec.push_back(color::GradientStop{position, rgb});
    return true;
  };

  if (gradient.is_object())
  {
    for (auto it = gradient.begin(); it != gradient.end(); ++it)
    {
      double position = 0.0;
      if (!parseStopPosition(it.key(), position))
      {
        error_message = "Gradient stop '" + it.key() + "' is not a number";
        return false;
      }
      if (!addStop(position, it.value()))
      {
        return false;
      }
    }
  }
  else if (gradient.is_array())
  {
    for (const auto& entry : gradient)
    {
      if (!entry.is_array() || entry.size() != 2 || !entry[0].is_number())
      {
        error_message = "Gradient entries must be [stop, color] pairs";
        return false;
      }
      if (!addStop(entry[0].get<double>(), entry[1]))
      {
        return false;
      }
    }
  }
  else
  {
    error_message = "'gradient' must be an object or an array of [stop, color] pairs";
    return false;
  }

  if (spec.empty())
  {
    error_message = "Gradient must have at least one stop";
    return false;
  }

  for (const auto& stop : spec)
  {
    if (!std::isfinite(stop.position) || stop.position < 0.0 || stop.position > 1.0)
    {
      error_message = "Gradient stop " + std::to_string(stop.position) + " is outside [0, 1]";
      return false;
    }
  }

  return true;
}

bool parseRenderRequest(const Json& document,
                        raster::RenderRequest& request,
                        ErrorKind& kind,
                        std::string& error_message)
{
  kind = ErrorKind::INVALID_REQUEST;

  if (!document.is_object())
  {
    error_message = "Request body must be a JSON object";
    return false;
  }

  std::vector<std::string> missing;
  for (const char* field : {"points", "width", "height", "gradient", "bounds"})
  {
    if (!document.contains(field) || document.at(field).is_null())
    {
      missing.push_back(field);
    }
  }

  if (!missing.empty())
  {
    error_message = "Missing required parameters:";
    for (const auto& field : missing)
    {
      error_message += " " + field;
    }
    return false;
  }

  try
  {
    RenderMode mode = RenderMode::FEATHERED;
    if (document.contains("mode"))
    {
      const std::string mode_name = document.at("mode").get<std::string>();
      if (mode_name == "fine")
      {
        mode = RenderMode::FINE;
      }
      else if (mode_name != "feathered")
      {
        error_message = "Unknown mode '" + mode_name + "' (expected 'fine' or 'feathered')";
        return false;
      }
    }

    request.config = makeRasterConfig(mode);
    RasterConfig& config = request.config;

    if (!readInteger(document, "width", config.width, error_message) ||
        !readInteger(document, "height", config.height, error_message))
    {
      return false;
    }

    if (document.contains("cellSize") &&
        !readInteger(document, "cellSize", config.cell_size, error_message))
    {
      return false;
    }

    if (document.contains("max") &&
        !readNumber(document, "max", config.max_value, error_message))
    {
      return false;
    }

    if (document.contains("exp") &&
        !readNumber(document, "exp", config.exponent, error_message))
    {
      return false;
    }

    if (document.contains("fadeDistance") &&
        !readNumber(document, "fadeDistance", config.fade_distance, error_message))
    {
      return false;
    }

    if (document.contains("feathering"))
    {
      config.feathering = document.at("feathering").get<bool>();
    }

    if (document.contains("prefill"))
    {
      config.prefill_background = document.at("prefill").get<bool>();
    }

    if (!parsePoints(document.at("points"), request.points, error_message) ||
        !parseBounds(document.at("bounds"), request.bounds, error_message))
    {
      return false;
    }

    if (!parseGradient(document.at("gradient"), request.gradient, error_message))
    {
      kind = ErrorKind::INVALID_GRADIENT;
      return false;
    }
  }
  catch (const Json::exception& e)
  {
    error_message = std::string("Malformed request: ") + e.what();
    return false;
  }

  spdlog::debug("Parsed request: {}x{}, {} points, {} gradient stops",
                request.config.width, request.config.height,
                request.points.size(), request.gradient.size());

  kind = ErrorKind::NONE;
  return true;
}

bool loadRenderRequest(const std::string& filename,
                       raster::RenderRequest& request,
                       ErrorKind& kind,
                       std::string& error_message)
{
  std::ifstream file(filename);
  if (!file)
  {
    kind = ErrorKind::INVALID_REQUEST;
    error_message = "Failed to open request file: " + filename;
    return false;
  }

  Json document;
  try
  {
    document = Json::parse(file);
  }
  catch (const Json::parse_error& e)
  {
    kind = ErrorKind::INVALID_REQUEST;
    error_message = "Invalid JSON in " + filename + ": " + e.what();
    return false;
  }

  return parseRenderRequest(document, request, kind, error_message);
}

}
}
