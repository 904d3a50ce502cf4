#include "idw/raster/idw_engine.hpp"
#include "idw/geo/projection.hpp"
#include "idw/geo/distance.hpp"
#include <spdlog/spdlog.h>
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>

namespace idw
{
namespace raster
{

namespace
{

uint8_t toChannel(double value)
{
  long rounded = std::lround(value);
  return static_cast<uint8_t>(std::max(0L, std::min(255L, rounded)));
}

color::Rgb blend(const color::Rgb& fg, const color::Rgb& bg, double alpha)
{
  Eigen::Vector3d mixed = fg.cast<double>() * alpha + bg.cast<double>() * (1.0 - alpha);
  return color::Rgb(toChannel(mixed[0]), toChannel(mixed[1]), toChannel(mixed[2]));
}

}

CellEstimate estimateAt(const geo::LatLng& location,
                        const geo::SampleSet& points,
                        const RasterConfig& config,
                        std::vector<double>& distances)
{
  CellEstimate estimate;

  distances.resize(points.size());
  estimate.min_distance = geo::batchHaversine(location, points.data(),
                                              points.size(), distances.data());

  double numerator = 0.0;
  double denominator = 0.0;
  size_t nearest = 0;

  for (size_t i = 0; i < points.size(); ++i)
  {
    const double weight = 1.0 / std::max(std::pow(distances[i], config.exponent), config.epsilon);
    numerator += points[i].value * weight;
    denominator += weight;

    if (distances[i] < distances[nearest])
    {
      nearest = i;
    }
  }

  if (denominator > 0.0 && std::isfinite(denominator) && std::isfinite(numerator))
  {
    estimate.value = numerator / denominator;
  }
  else if (!points.empty())
  {
    estimate.value = points[nearest].value;
  }

  estimate.value = std::min(estimate.value, config.max_value);
  estimate.gradient_index = gradientIndex(estimate.value, config.max_value);
  estimate.alpha = config.feathering ?
      featherAlpha(estimate.min_distance, config.fade_distance) : 1.0;

  return estimate;
}

int gradientIndex(double value, double max_value)
{
  if (max_value == 0.0)
  {
    return 0;
  }

  const double scaled = (value / max_value) * (GRADIENT_LOOKUP_SIZE - 1);
  if (!std::isfinite(scaled))
  {
    return 0;
  }

  long index = std::lround(scaled);
  return static_cast<int>(std::max(0L, std::min(static_cast<long>(GRADIENT_LOOKUP_SIZE - 1), index)));
}

double featherAlpha(double min_distance, double fade_distance)
{
  if (min_distance <= fade_distance)
  {
    return 1.0;
  }
  return std::max(0.0, 1.0 - (min_distance - fade_distance) / fade_distance);
}

struct IDWEngine::Implementation
{
  struct RowStats
  {
    size_t cells = 0;
    size_t faded = 0;
  };

  bool validate(const RenderRequest& request, ErrorKind& kind,
                std::string& error_message) const
  {
    const RasterConfig& config = request.config;

    if (config.width <= 0 || config.height <= 0 || config.cell_size <= 0)
    {
      kind = ErrorKind::INVALID_DIMENSIONS;
      error_message = "width, height and cellSize must be positive (got " +
                      std::to_string(config.width) + "x" + std::to_string(config.height) +
                      ", cell " + std::to_string(config.cell_size) + ")";
      return false;
    }

    if (config.width > MAX_RASTER_DIMENSION || config.height > MAX_RASTER_DIMENSION)
    {
      kind = ErrorKind::INVALID_DIMENSIONS;
      error_message = "Raster dimensions exceed " + std::to_string(MAX_RASTER_DIMENSION) + " pixels";
      return false;
    }

    if (!request.bounds.isValid())
    {
      kind = ErrorKind::INVALID_BOUNDING_BOX;
      error_message = "Bounding box requires minLat < maxLat, minLng < maxLng "
                      "and latitudes strictly between the poles";
      return false;
    }

    if (request.points.empty())
    {
      kind = ErrorKind::EMPTY_POINT_SET;
      error_message = "At least one sample point is required";
      return false;
    }

    for (size_t i = 0; i < request.points.size(); ++i)
    {
      const auto& point = request.points[i];
      if (!point.isFinite() || point.lat < -90.0 || point.lat > 90.0)
      {
        kind = ErrorKind::INVALID_SAMPLE;
        error_message = "Sample " + std::to_string(i) +
                        " has a non-finite component or a latitude outside [-90, 90]";
        return false;
      }
    }

    if (!std::isfinite(config.exponent) || config.exponent <= 0.0)
    {
      kind = ErrorKind::INVALID_EXPONENT;
      error_message = "IDW exponent must be positive (got " + std::to_string(config.exponent) + ")";
      return false;
    }

    if (!std::isfinite(config.max_value) || config.max_value < 0.0)
    {
      kind = ErrorKind::INVALID_PARAMETER;
      error_message = "max must be a finite, non-negative number";
      return false;
    }

    if (!std::isfinite(config.epsilon) || config.epsilon <= 0.0)
    {
      kind = ErrorKind::INVALID_PARAMETER;
      error_message = "Weight epsilon must be positive";
      return false;
    }

    if (config.feathering &&
        (!std::isfinite(config.fade_distance) || config.fade_distance <= 0.0))
    {
      kind = ErrorKind::INVALID_PARAMETER;
      error_message = "fadeDistance must be positive when feathering is enabled";
      return false;
    }

    return true;
  }

  void prefill(RasterImage& image, const color::Rgb& background) const
  {
    for (int y = 0; y < image.height; ++y)
    {
      for (int x = 0; x < image.width; ++x)
      {
        image.setPixel(x, y, background, 255);
      }
    }
  }

  RowStats renderCellRow(int row, int cells_x, int cell,
                         const RenderRequest& request,
                         const color::GradientLookup& lookup,
                         RasterImage& image,
                         std::vector<double>& distances) const
  {
    const RasterConfig& config = request.config;
    const double half_cell = cell / 2.0;
    const color::Rgb& background = lookup.background();

    RowStats stats;

    const int y0 = row * cell;
    const int y1 = y0 + std::min(cell, image.height - y0);

    for (int col = 0; col < cells_x; ++col)
    {
      const int x0 = col * cell;
      const int x1 = x0 + std::min(cell, image.width - x0);

      geo::LatLng center = geo::pixelToLatLng(x0 + half_cell, y0 + half_cell,
                                              image.width, image.height,
                                              request.bounds);

      CellEstimate estimate = estimateAt(center, request.points, config, distances);

      const color::Rgb rgb = blend(lookup[estimate.gradient_index], background, estimate.alpha);
      const uint8_t alpha = toChannel(255.0 * estimate.alpha);

      for (int y = y0; y < y1; ++y)
      {
        for (int x = x0; x < x1; ++x)
        {
          image.setPixel(x, y, rgb, alpha);
        }
      }

      stats.cells++;
      if (estimate.alpha < 1.0)
      {
        stats.faded++;
      }
    }

    return stats;
  }

  RenderResult render(const RenderRequest& request) const
  {
    auto start_time = std::chrono::steady_clock::now();

    RenderResult result;

    ErrorKind kind = ErrorKind::NONE;
    std::string error_message;
    if (!validate(request, kind, error_message))
    {
      spdlog::error("IDWEngine: {}: {}", errorKindToString(kind), error_message);
      result.fail(kind, error_message);
      return result;
    }

    color::GradientLookup lookup;
    if (!color::GradientLookup::build(request.gradient, lookup, error_message))
    {
      spdlog::error("IDWEngine: InvalidGradient: {}", error_message);
      result.fail(ErrorKind::INVALID_GRADIENT, error_message);
      return result;
    }

    const RasterConfig& config = request.config;
    const auto& bounds = request.bounds;

    if (bounds.max_lat > MERCATOR_MAX_LATITUDE || bounds.min_lat < -MERCATOR_MAX_LATITUDE)
    {
      spdlog::warn("IDWEngine: Bounds [{:.4f}, {:.4f}] reach beyond the Web Mercator limit of {:.4f} deg",
                   bounds.min_lat, bounds.max_lat, MERCATOR_MAX_LATITUDE);
    }

    result.image.allocate(config.width, config.height);

    if (config.prefill_background)
    {
      prefill(result.image, lookup.background());
    }

    // A cell larger than the raster covers the same pixels as one the raster's size.
    const int cell = std::min(config.cell_size, std::max(config.width, config.height));
    const int cells_x = (config.width - 1) / cell + 1;
    const int cells_y = (config.height - 1) / cell + 1;

    spdlog::debug("IDWEngine: {}x{} cells of {} px, {} samples, exp={}, feathering={}",
                  cells_x, cells_y, cell, request.points.size(),
                  config.exponent, config.feathering);

    std::atomic<size_t> cells_computed{0};
    std::atomic<size_t> cells_faded{0};

    if (config.parallel)
    {
      tbb::parallel_for(tbb::blocked_range<int>(0, cells_y),
        [&](const tbb::blocked_range<int>& range)
        {
          std::vector<double> distances;
          for (int row = range.begin(); row != range.end(); ++row)
          {
            RowStats stats = renderCellRow(row, cells_x, cell, request, lookup,
                                           result.image, distances);
            cells_computed += stats.cells;
            cells_faded += stats.faded;
          }
        });
    }
    else
    {
      std::vector<double> distances;
      for (int row = 0; row < cells_y; ++row)
      {
        RowStats stats = renderCellRow(row, cells_x, cell, request, lookup,
                                       result.image, distances);
        cells_computed += stats.cells;
        cells_faded += stats.faded;
      }
    }

    result.cells_computed = cells_computed.load();
    result.cells_faded = cells_faded.load();
    result.distance_evaluations = result.cells_computed * request.points.size();
    result.status = Status::SUCCESS;

    auto end_time = std::chrono::steady_clock::now();
    result.computation_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    spdlog::info("IDWEngine: Rendered {}x{} raster ({} cells, {} faded, {} samples) in {:.2f} ms",
                 config.width, config.height, result.cells_computed, result.cells_faded,
                 request.points.size(), result.computation_time_ms);

    return result;
  }
};

IDWEngine::IDWEngine()
  : impl_(std::make_unique<Implementation>())
{
}

IDWEngine::~IDWEngine() = default;

RenderResult IDWEngine::render(const RenderRequest& request) const
{
  return impl_->render(request);
}

bool IDWEngine::validate(const RenderRequest& request, ErrorKind& kind,
                         std::string& error_message) const
{
  return impl_->validate(request, kind, error_message);
}

}
}
