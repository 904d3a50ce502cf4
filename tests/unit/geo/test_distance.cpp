#include <gtest/gtest.h>
#include "idw/geo/distance.hpp"
#include "idw/common.hpp"
#include <algorithm>
#include <random>
#include <vector>

namespace idw
{
namespace geo
{

class DistanceTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    rng_.seed(42);
  }

  LatLng randomPoint()
  {
    return LatLng{lat_dist_(rng_), lng_dist_(rng_)};
  }

  std::mt19937 rng_;
  std::uniform_real_distribution<double> lat_dist_{-89.0, 89.0};
  std::uniform_real_distribution<double> lng_dist_{-180.0, 180.0};
};

TEST_F(DistanceTest, CoincidentPointsAreZero)
{
  for (int i = 0; i < 500; ++i)
  {
    LatLng a = randomPoint();
    EXPECT_DOUBLE_EQ(haversine(a, a), 0.0);
  }
}

TEST_F(DistanceTest, Symmetric)
{
  for (int i = 0; i < 500; ++i)
  {
    LatLng a = randomPoint();
    LatLng b = randomPoint();
    EXPECT_DOUBLE_EQ(haversine(a, b), haversine(b, a));
  }
}

TEST_F(DistanceTest, OneDegreeOfLatitude)
{
  double expected = EARTH_RADIUS_M * PI / 180.0;

  EXPECT_NEAR(haversine(LatLng{0.0, 0.0}, LatLng{1.0, 0.0}), expected, 1e-3);
  EXPECT_NEAR(haversine(LatLng{45.0, 7.0}, LatLng{46.0, 7.0}), expected, 1e-3);
}

TEST_F(DistanceTest, LongitudeShrinksWithLatitude)
{
  double at_equator = haversine(LatLng{0.0, 0.0}, LatLng{0.0, 1.0});
  double at_sixty = haversine(LatLng{60.0, 0.0}, LatLng{60.0, 1.0});

  EXPECT_NEAR(at_sixty / at_equator, 0.5, 1e-4);
}

TEST_F(DistanceTest, Antipodal)
{
  double d = haversine(LatLng{0.0, 0.0}, LatLng{0.0, 180.0});
  EXPECT_NEAR(d, PI * EARTH_RADIUS_M, 1e-3);
}

TEST_F(DistanceTest, TriangleInequality)
{
  for (int i = 0; i < 500; ++i)
  {
    LatLng a = randomPoint();
    LatLng b = randomPoint();
    LatLng c = randomPoint();

    EXPECT_LE(haversine(a, c), haversine(a, b) + haversine(b, c) + 1e-6);
  }
}

TEST_F(DistanceTest, BatchMatchesScalar)
{
  constexpr size_t count = 257;
  std::vector<SamplePoint> samples(count);
  for (auto& s : samples)
  {
    LatLng p = randomPoint();
    s.lat = p.lat;
    s.lng = p.lng;
  }

  LatLng query = randomPoint();
  std::vector<double> distances(count);

  double min_dist = batchHaversine(query, samples.data(), count, distances.data());

  double expected_min = INFINITY_D;
  for (size_t i = 0; i < count; ++i)
  {
    double d = haversine(query, samples[i].location());
    EXPECT_DOUBLE_EQ(distances[i], d) << "Mismatch at index " << i;
    expected_min = std::min(expected_min, d);
  }
  EXPECT_DOUBLE_EQ(min_dist, expected_min);
}

TEST_F(DistanceTest, BatchOfNothingIsInfinite)
{
  double min_dist = batchHaversine(LatLng{0.0, 0.0}, nullptr, 0, nullptr);
  EXPECT_EQ(min_dist, INFINITY_D);
}

}
}
