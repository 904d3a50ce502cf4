#include "idw/raster/idw_engine.hpp"
#include "idw/io/request_parser.hpp"
#include "idw/io/png_encoder.hpp"
#include "idw/io/render_report.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <string>

namespace
{

void printUsage(const char* program)
{
  std::cerr << "Usage: " << program << " <request.json> <output.png>"
            << " [--report <file>] [--log-level trace|debug|info|warn|error]"
            << " [--sequential]" << std::endl;
}

}

int main(int argc, char** argv)
{
  if (argc < 3)
  {
    printUsage(argv[0]);
    return 1;
  }

  const std::string request_file = argv[1];
  const std::string output_file = argv[2];
  std::string report_file;
  bool sequential = false;

  for (int i = 3; i < argc; ++i)
  {
    const std::string arg = argv[i];
    if (arg == "--report" && i + 1 < argc)
    {
      report_file = argv[++i];
    }
    else if (arg == "--log-level" && i + 1 < argc)
    {
      spdlog::set_level(spdlog::level::from_str(argv[++i]));
    }
    else if (arg == "--sequential")
    {
      sequential = true;
    }
    else
    {
      printUsage(argv[0]);
      return 1;
    }
  }

  idw::raster::RenderRequest request;
  idw::ErrorKind kind = idw::ErrorKind::NONE;
  std::string error_message;

  if (!idw::io::loadRenderRequest(request_file, request, kind, error_message))
  {
    spdlog::error("{}: {}", idw::errorKindToString(kind), error_message);
    return 1;
  }

  if (sequential)
  {
    request.config.parallel = false;
  }

  try
  {
    idw::raster::IDWEngine engine;
    idw::raster::RenderResult result = engine.render(request);

    if (!report_file.empty() &&
        !idw::io::exportRenderReport(report_file, request, result, error_message))
    {
      spdlog::warn("{}", error_message);
    }

    if (!result.isSuccess())
    {
      spdlog::error("Render failed ({}): {}",
                    idw::errorKindToString(result.error), result.error_message);
      return 1;
    }

    if (!idw::io::writePNG(result.image, output_file, kind, error_message))
    {
      spdlog::error("{}: {}", idw::errorKindToString(kind), error_message);
      return 1;
    }
  }
  catch (const std::exception& e)
  {
    spdlog::error("Unexpected failure: {}", e.what());
    return 1;
  }

  return 0;
}
