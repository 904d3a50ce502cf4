#include <gtest/gtest.h>
#include "idw/io/request_parser.hpp"
#include "idw/io/render_report.hpp"
#include "idw/raster/idw_engine.hpp"

namespace idw
{
namespace io
{

class RequestParserTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    document_ = nlohmann::ordered_json::parse(R"({
      "points": [[5.0, 5.0, 100.0], [2.5, 7.5, 20.0]],
      "width": 64,
      "height": 48,
      "max": 100,
      "bounds": {"minLat": 0, "minLng": 0, "maxLat": 10, "maxLng": 10},
      "gradient": {"0": "#000066", "0.5": "blue", "1": "red"}
    })");
  }

  bool parse()
  {
    return parseRenderRequest(document_, request_, kind_, error_message_);
  }

  nlohmann::ordered_json document_;
  raster::RenderRequest request_;
  ErrorKind kind_ = ErrorKind::NONE;
  std::string error_message_;
};

TEST_F(RequestParserTest, ParsesCompleteRequest)
{
  ASSERT_TRUE(parse()) << error_message_;
  EXPECT_EQ(kind_, ErrorKind::NONE);

  ASSERT_EQ(request_.points.size(), 2u);
  EXPECT_DOUBLE_EQ(request_.points[1].lat, 2.5);
  EXPECT_DOUBLE_EQ(request_.points[1].lng, 7.5);
  EXPECT_DOUBLE_EQ(request_.points[1].value, 20.0);

  EXPECT_EQ(request_.config.width, 64);
  EXPECT_EQ(request_.config.height, 48);
  EXPECT_DOUBLE_EQ(request_.config.max_value, 100.0);
  EXPECT_DOUBLE_EQ(request_.bounds.max_lat, 10.0);

  ASSERT_EQ(request_.gradient.size(), 3u);
  EXPECT_DOUBLE_EQ(request_.gradient[1].position, 0.5);
  EXPECT_EQ(static_cast<int>(request_.gradient[0].color[2]), 0x66);
  EXPECT_EQ(static_cast<int>(request_.gradient[2].color[0]), 255);
}

TEST_F(RequestParserTest, DefaultsToFeatheredMode)
{
  ASSERT_TRUE(parse()) << error_message_;

  EXPECT_EQ(request_.config.cell_size, 10);
  EXPECT_TRUE(request_.config.feathering);
  EXPECT_TRUE(request_.config.prefill_background);
  EXPECT_DOUBLE_EQ(request_.config.exponent, 2.0);
  EXPECT_DOUBLE_EQ(request_.config.fade_distance, 100000.0);
}

TEST_F(RequestParserTest, FineModeAndOverrides)
{
  document_["mode"] = "fine";
  document_["exp"] = 3.5;
  document_["cellSize"] = 4;
  document_["fadeDistance"] = 25000;
  document_["feathering"] = true;

  ASSERT_TRUE(parse()) << error_message_;

  EXPECT_EQ(request_.config.cell_size, 4);
  EXPECT_DOUBLE_EQ(request_.config.exponent, 3.5);
  EXPECT_DOUBLE_EQ(request_.config.fade_distance, 25000.0);
  EXPECT_TRUE(request_.config.feathering);
  EXPECT_FALSE(request_.config.prefill_background);
}

TEST_F(RequestParserTest, ReportsAllMissingFields)
{
  document_.erase("points");
  document_.erase("bounds");

  EXPECT_FALSE(parse());
  EXPECT_EQ(kind_, ErrorKind::INVALID_REQUEST);
  EXPECT_NE(error_message_.find("points"), std::string::npos);
  EXPECT_NE(error_message_.find("bounds"), std::string::npos);
}

TEST_F(RequestParserTest, RejectsUnknownMode)
{
  document_["mode"] = "bicubic";
  EXPECT_FALSE(parse());
  EXPECT_EQ(kind_, ErrorKind::INVALID_REQUEST);
}

TEST_F(RequestParserTest, RejectsWrongTypes)
{
  document_["mode"] = 5;
  EXPECT_FALSE(parse());
  EXPECT_EQ(kind_, ErrorKind::INVALID_REQUEST);
}

TEST_F(RequestParserTest, RejectsFractionalWidth)
{
  document_["width"] = 64.5;
  EXPECT_FALSE(parse());
  EXPECT_EQ(kind_, ErrorKind::INVALID_REQUEST);
}

TEST_F(RequestParserTest, RejectsMalformedPoint)
{
  document_["points"] = nlohmann::ordered_json::parse(R"([[1.0, 2.0]])");
  EXPECT_FALSE(parse());
  EXPECT_EQ(kind_, ErrorKind::INVALID_REQUEST);
}

TEST_F(RequestParserTest, RejectsIncompleteBounds)
{
  document_["bounds"].erase("maxLng");
  EXPECT_FALSE(parse());
  EXPECT_EQ(kind_, ErrorKind::INVALID_REQUEST);
}

TEST_F(RequestParserTest, UnknownColorIsGradientError)
{
  document_["gradient"]["0.5"] = "blurple";
  EXPECT_FALSE(parse());
  EXPECT_EQ(kind_, ErrorKind::INVALID_GRADIENT);
}

TEST_F(RequestParserTest, StopOutsideUnitIntervalIsGradientError)
{
  document_["gradient"]["1.5"] = "white";
  EXPECT_FALSE(parse());
  EXPECT_EQ(kind_, ErrorKind::INVALID_GRADIENT);
}

TEST_F(RequestParserTest, GradientKeepsDeclarationOrder)
{
  document_["gradient"] = nlohmann::ordered_json::parse(
      R"({"1": "white", "0": "black", "1.0": "red"})");

  ASSERT_TRUE(parse()) << error_message_;
  ASSERT_EQ(request_.gradient.size(), 3u);
  EXPECT_DOUBLE_EQ(request_.gradient[0].position, 1.0);
  EXPECT_DOUBLE_EQ(request_.gradient[2].position, 1.0);

  color::GradientLookup lookup;
  ASSERT_TRUE(color::GradientLookup::build(request_.gradient, lookup, error_message_));
  EXPECT_EQ(static_cast<int>(lookup[255][0]), 255);
  EXPECT_EQ(static_cast<int>(lookup[255][1]), 0);
}

TEST_F(RequestParserTest, GradientAsPairArray)
{
  document_["gradient"] = nlohmann::ordered_json::parse(
      R"json([[0, "#000"], [1, "rgb(255, 255, 255)"]])json");

  ASSERT_TRUE(parse()) << error_message_;
  ASSERT_EQ(request_.gradient.size(), 2u);
  EXPECT_EQ(static_cast<int>(request_.gradient[1].color[1]), 255);
}

TEST_F(RequestParserTest, MissingFileFails)
{
  EXPECT_FALSE(loadRenderRequest("/nonexistent/request.json", request_, kind_, error_message_));
  EXPECT_EQ(kind_, ErrorKind::INVALID_REQUEST);
}

TEST_F(RequestParserTest, ParsedRequestRendersAndReports)
{
  ASSERT_TRUE(parse()) << error_message_;

  raster::IDWEngine engine;
  raster::RenderResult result = engine.render(request_);
  ASSERT_TRUE(result.isSuccess()) << result.error_message;
  EXPECT_EQ(result.image.width, 64);
  EXPECT_EQ(result.image.height, 48);

  nlohmann::json report = renderReportToJSON(request_, result);
  EXPECT_EQ(report["config"]["width"], 64);
  EXPECT_EQ(report["point_count"], 2);
  EXPECT_EQ(report["result"]["success"], true);
  EXPECT_EQ(report["result"]["error"], "None");
  EXPECT_EQ(report["gradient"].size(), 3u);
  EXPECT_EQ(report["gradient"][0][1], "#000066");
  EXPECT_EQ(report["statistics"]["cells_computed"], result.cells_computed);
}

TEST_F(RequestParserTest, FailedRenderIsReported)
{
  document_["exp"] = 0;
  ASSERT_TRUE(parse()) << error_message_;

  raster::IDWEngine engine;
  raster::RenderResult result = engine.render(request_);
  ASSERT_FALSE(result.isSuccess());

  nlohmann::json report = renderReportToJSON(request_, result);
  EXPECT_EQ(report["result"]["success"], false);
  EXPECT_EQ(report["result"]["error"], "InvalidExponent");
  EXPECT_TRUE(report["result"].contains("message"));
}

}
}
