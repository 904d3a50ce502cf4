#ifndef IDW_IO_RENDER_REPORT_HPP_
#define IDW_IO_RENDER_REPORT_HPP_

#include "idw/raster/render_request.hpp"
#include "idw/raster/render_result.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace idw
{
namespace io
{

nlohmann::json renderReportToJSON(const raster::RenderRequest& request,
                                  const raster::RenderResult& result);

bool exportRenderReport(const std::string& filename,
                        const raster::RenderRequest& request,
                        const raster::RenderResult& result,
                        std::string& error_message);

}
}

#endif
