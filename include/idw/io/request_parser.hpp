#ifndef IDW_IO_REQUEST_PARSER_HPP_
#define IDW_IO_REQUEST_PARSER_HPP_

#include "idw/common.hpp"
#include "idw/raster/render_request.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace idw
{
namespace io
{

bool parseRenderRequest(const nlohmann::ordered_json& document,
                        raster::RenderRequest& request,
                        ErrorKind& kind,
                        std::string& error_message);

bool loadRenderRequest(const std::string& filename,
                       raster::RenderRequest& request,
                       ErrorKind& kind,
                       std::string& error_message);

bool parseGradient(const nlohmann::ordered_json& gradient,
                   color::GradientSpec& spec,
                   std::string& error_message);

}
}

#endif
