#include "idw/io/render_report.hpp"
#include "idw/color/color_parser.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace idw
{
namespace io
{

nlohmann::json renderReportToJSON(const raster::RenderRequest& request,
                                  const raster::RenderResult& result)
{
  const RasterConfig& config = request.config;

  nlohmann::json j;

  j["config"]["width"] = config.width;
  j["config"]["height"] = config.height;
  j["config"]["cell_size"] = config.cell_size;
  j["config"]["max"] = config.max_value;
  j["config"]["exp"] = config.exponent;
  j["config"]["feathering"] = config.feathering;
  j["config"]["fade_distance"] = config.fade_distance;
  j["config"]["prefill_background"] = config.prefill_background;
  j["config"]["parallel"] = config.parallel;

  j["bounds"]["min_lat"] = request.bounds.min_lat;
  j["bounds"]["min_lng"] = request.bounds.min_lng;
  j["bounds"]["max_lat"] = request.bounds.max_lat;
  j["bounds"]["max_lng"] = request.bounds.max_lng;

  j["point_count"] = request.points.size();

  j["gradient"] = nlohmann::json::array();
  for (const auto& stop : request.gradient)
  {
    j["gradient"].push_back(nlohmann::json::array({stop.position, color::toHexString(stop.color)}));
  }

  j["result"]["success"] = result.isSuccess();
  j["result"]["error"] = errorKindToString(result.error);
  if (!result.error_message.empty())
  {
    j["result"]["message"] = result.error_message;
  }

  j["statistics"]["cells_computed"] = result.cells_computed;
  j["statistics"]["cells_faded"] = result.cells_faded;
  j["statistics"]["distance_evaluations"] = result.distance_evaluations;
  j["statistics"]["computation_time_ms"] = result.computation_time_ms;

  return j;
}

bool exportRenderReport(const std::string& filename,
                        const raster::RenderRequest& request,
                        const raster::RenderResult& result,
                        std::string& error_message)
{
  std::ofstream file(filename);
  if (!file.is_open())
  {
    error_message = "Failed to open report file: " + filename;
    return false;
  }

  file << renderReportToJSON(request, result).dump(2);
  spdlog::info("Render report exported to {}", filename);
  return true;
}

}
}
