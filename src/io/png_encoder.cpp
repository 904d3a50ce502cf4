#include "idw/io/png_encoder.hpp"
#include <gdal_priv.h>
#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_vsi.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <memory>
#include <sstream>

namespace idw
{
namespace io
{

namespace
{

std::string makeMemPath(const raster::RasterImage& image)
{
  std::ostringstream path;
  path << "/vsimem/idw_raster_" << static_cast<const void*>(image.data.data()) << ".png";
  return path.str();
}

}

bool encodePNG(const raster::RasterImage& image,
               std::vector<uint8_t>& bytes,
               ErrorKind& kind,
               std::string& error_message)
{
  kind = ErrorKind::ENCODING_FAILED;

  if (!image.isValid())
  {
    error_message = "Cannot encode an empty or inconsistent raster";
    return false;
  }

  GDALAllRegister();

  GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
  GDALDriver* png_driver = GetGDALDriverManager()->GetDriverByName("PNG");
  if (!mem_driver || !png_driver)
  {
    error_message = "GDAL MEM or PNG driver not available";
    return false;
  }

  std::unique_ptr<GDALDataset, decltype(&GDALClose)> source(
      mem_driver->Create("", image.width, image.height,
                         raster::RasterImage::CHANNELS, GDT_Byte, nullptr),
      &GDALClose);

  if (!source)
  {
    error_message = "Failed to create in-memory dataset";
    return false;
  }

  const int channels = raster::RasterImage::CHANNELS;
  CPLErr err = source->RasterIO(GF_Write, 0, 0, image.width, image.height,
                                const_cast<uint8_t*>(image.data.data()),
                                image.width, image.height, GDT_Byte,
                                channels, nullptr,
                                channels,
                                static_cast<GSpacing>(channels) * image.width,
                                1);
  if (err != CE_None)
  {
    error_message = "Failed to copy pixels into in-memory dataset";
    return false;
  }

  source->GetRasterBand(1)->SetColorInterpretation(GCI_RedBand);
  source->GetRasterBand(2)->SetColorInterpretation(GCI_GreenBand);
  source->GetRasterBand(3)->SetColorInterpretation(GCI_BlueBand);
  source->GetRasterBand(4)->SetColorInterpretation(GCI_AlphaBand);

  const std::string mem_path = makeMemPath(image);

  GDALDataset* encoded = png_driver->CreateCopy(mem_path.c_str(), source.get(),
                                                FALSE, nullptr, nullptr, nullptr);
  if (!encoded)
  {
    VSIUnlink(mem_path.c_str());
    error_message = "PNG driver failed: " + std::string(CPLGetLastErrorMsg());
    return false;
  }
  GDALClose(encoded);

  vsi_l_offset length = 0;
  GByte* buffer = VSIGetMemFileBuffer(mem_path.c_str(), &length, TRUE);
  if (!buffer)
  {
    error_message = "Failed to retrieve encoded PNG from " + mem_path;
    return false;
  }

  bytes.assign(buffer, buffer + length);
  VSIFree(buffer);
  kind = ErrorKind::NONE;

  spdlog::debug("Encoded {}x{} raster to {} PNG bytes", image.width, image.height, bytes.size());
  return true;
}

bool writePNG(const raster::RasterImage& image,
              const std::string& output_file,
              ErrorKind& kind,
              std::string& error_message)
{
  std::vector<uint8_t> bytes;
  if (!encodePNG(image, bytes, kind, error_message))
  {
    return false;
  }

  std::ofstream file(output_file, std::ios::binary);
  kind = ErrorKind::ENCODING_FAILED;
  if (!file)
  {
    error_message = "Failed to create output file: " + output_file;
    return false;
  }

  file.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  if (!file)
  {
    error_message = "Failed to write output file: " + output_file;
    return false;
  }

  kind = ErrorKind::NONE;
  spdlog::info("Wrote {} bytes to {}", bytes.size(), output_file);
  return true;
}

}
}
