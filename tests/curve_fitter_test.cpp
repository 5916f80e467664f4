/**
 * @file curve_fitter_test.cpp
 * @brief Tests for the interpolating B-spline and the pending-set interpolator.
 */

#include "curve_fitter.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

#include "gtest/gtest.h"
#include "interpolator.hpp"

namespace {

double NearestSampleDistance(const std::vector<CurveSample>& curve, const Coordinate& p) {
  double best = std::numeric_limits<double>::max();
  for (const auto& s : curve) best = std::min(best, std::hypot(s.x - p.x, s.y - p.y));
  return best;
}

/**
 * @brief Fitter that records its input and returns a fixed two-sample curve.
 */
class RecordingFitter : public CurveFitter {
 public:
  std::vector<CurveSample> fit(const PointList& points, int samples) override {
    calls++;
    last_points = points;
    last_samples = samples;
    return {{0.4, 0.6}, {10.5, 20.49}};
  }
  int calls = 0;
  PointList last_points;
  int last_samples = 0;
};

// ============================================================================
// PARAMETERISATION
// ============================================================================

TEST(BSplineFitterTest, ChordLengthParametersAreNormalised) {
  auto u = chord_length_parameters({{0, 0}, {3, 4}, {3, 10}});
  ASSERT_EQ(3u, u.size());
  EXPECT_DOUBLE_EQ(0.0, u[0]);
  EXPECT_NEAR(5.0 / 11.0, u[1], 1e-12);
  EXPECT_DOUBLE_EQ(1.0, u[2]);
}

TEST(BSplineFitterTest, EvenDegreeKnotsSitBetweenParameters) {
  auto t = interpolation_knots({0.0, 0.2, 0.5, 0.7, 1.0}, 2);
  std::vector<double> expected{0, 0, 0, 0.35, 0.6, 1, 1, 1};
  ASSERT_EQ(expected.size(), t.size());
  for (size_t i = 0; i < t.size(); ++i) EXPECT_NEAR(expected[i], t[i], 1e-12) << "knot " << i;
}

TEST(BSplineFitterTest, ThreePointsNeedNoInteriorKnots) {
  auto t = interpolation_knots({0.0, 0.4, 1.0}, 2);
  std::vector<double> expected{0, 0, 0, 1, 1, 1};
  EXPECT_EQ(expected, t);
}

// ============================================================================
// FITTING
// ============================================================================

TEST(BSplineFitterTest, ProducesRequestedSampleCountFromEndToEnd) {
  BSplineFitter fitter(2);
  PointList pts{{10, 10}, {40, 60}, {90, 20}, {120, 80}};
  auto curve = fitter.fit(pts, 100);
  ASSERT_EQ(100u, curve.size());
  EXPECT_NEAR(10.0, curve.front().x, 1e-9);
  EXPECT_NEAR(10.0, curve.front().y, 1e-9);
  EXPECT_NEAR(120.0, curve.back().x, 1e-9);
  EXPECT_NEAR(80.0, curve.back().y, 1e-9);
}

TEST(BSplineFitterTest, CurvePassesThroughEveryInputPoint) {
  BSplineFitter fitter(2);
  PointList pts{{0, 0}, {25, 40}, {60, 45}, {80, 10}, {120, 30}, {130, 90}};
  auto curve = fitter.fit(pts, 20001);
  for (const auto& p : pts) EXPECT_LT(NearestSampleDistance(curve, p), 0.25) << p.x << "," << p.y;
}

TEST(BSplineFitterTest, CollinearEvenlySpacedPointsGiveAStraightLine) {
  BSplineFitter fitter(2);
  auto curve = fitter.fit({{0, 0}, {10, 0}, {20, 0}, {30, 0}}, 7);
  ASSERT_EQ(7u, curve.size());
  for (size_t j = 0; j < curve.size(); ++j) {
    EXPECT_NEAR(30.0 * j / 6.0, curve[j].x, 1e-9);
    EXPECT_NEAR(0.0, curve[j].y, 1e-9);
  }
}

TEST(BSplineFitterTest, RejectsTooFewPoints) {
  BSplineFitter fitter(2);
  EXPECT_THROW(fitter.fit({{0, 0}, {1, 1}}, 10), std::invalid_argument);
  EXPECT_THROW(fitter.fit({{0, 0}, {1, 1}, {2, 5}}, 1), std::invalid_argument);
}

// ============================================================================
// INTERPOLATOR
// ============================================================================

TEST(InterpolatorTest, DedupKeepsFirstOccurrenceOrder) {
  PointList in{{3, 3}, {1, 1}, {3, 3}, {2, 2}, {1, 1}};
  PointList expected{{3, 3}, {1, 1}, {2, 2}};
  EXPECT_EQ(expected, dedup_points(in));
}

TEST(InterpolatorTest, FewerThanThreeUniquePointsClearTheCurve) {
  RecordingFitter fitter;
  Interpolator interp(fitter, 200, 150, 50, 0, 1000);
  PointList pending{{1, 1}, {5, 5}, {1, 1}};
  PointList curve{{9, 9}};
  EXPECT_TRUE(interp.recompute(pending, curve));
  EXPECT_TRUE(curve.empty());
  EXPECT_EQ(2u, pending.size());
  EXPECT_EQ(0, fitter.calls);
}

TEST(InterpolatorTest, FitsDeduplicatedPointsAndRoundsSamples) {
  RecordingFitter fitter;
  Interpolator interp(fitter, 200, 150, 50, 0, 1000);
  PointList pending{{0, 0}, {10, 0}, {0, 0}, {10, 10}};
  PointList curve;
  EXPECT_TRUE(interp.recompute(pending, curve));
  PointList expected_in{{0, 0}, {10, 0}, {10, 10}};
  EXPECT_EQ(expected_in, fitter.last_points);
  EXPECT_EQ(50, fitter.last_samples);
  PointList expected_curve{{0, 1}, {11, 20}};
  EXPECT_EQ(expected_curve, curve);
}

/**
 * @brief Fitter whose samples leave the workspace on every side.
 */
class OvershootingFitter : public CurveFitter {
 public:
  std::vector<CurveSample> fit(const PointList&, int) override {
    return {{-4.2, 10.0}, {250.0, -0.6}, {199.4, 149.6}, {80.0, 400.0}};
  }
};

TEST(InterpolatorTest, ClampsSamplesToWorkspace) {
  OvershootingFitter fitter;
  Interpolator interp(fitter, 200, 150, 4, 0, 1000);
  PointList pending{{0, 0}, {10, 140}, {190, 140}};
  PointList curve;
  EXPECT_TRUE(interp.recompute(pending, curve));
  PointList expected{{0, 10}, {199, 0}, {199, 149}, {80, 149}};
  EXPECT_EQ(expected, curve);
}

TEST(InterpolatorTest, RejectsEmptyWorkspace) {
  RecordingFitter fitter;
  EXPECT_THROW(Interpolator(fitter, 0, 150, 50, 0, 1000), std::invalid_argument);
  EXPECT_THROW(Interpolator(fitter, 200, -1, 50, 0, 1000), std::invalid_argument);
}

TEST(InterpolatorTest, GateSkipsWhenLastStepIsTooShort) {
  RecordingFitter fitter;
  Interpolator interp(fitter, 200, 150, 50, 5, 100);
  PointList pending{{0, 0}, {40, 0}, {42, 0}};
  PointList curve{{7, 7}};
  EXPECT_FALSE(interp.recompute(pending, curve));
  EXPECT_EQ(0, fitter.calls);
  PointList previous{{7, 7}};
  EXPECT_EQ(previous, curve);
}

TEST(InterpolatorTest, GateSkipsWhenLastStepIsTooLong) {
  RecordingFitter fitter;
  Interpolator interp(fitter, 200, 150, 50, 5, 100);
  PointList pending{{0, 0}, {40, 0}, {200, 0}};
  PointList curve;
  EXPECT_FALSE(interp.recompute(pending, curve));
  EXPECT_EQ(0, fitter.calls);
  EXPECT_TRUE(curve.empty());
}

TEST(InterpolatorTest, GateBoundsAreInclusive) {
  RecordingFitter fitter;
  Interpolator interp(fitter, 200, 150, 50, 5, 100);
  PointList pending{{0, 0}, {40, 0}, {45, 0}};
  PointList curve;
  EXPECT_TRUE(interp.recompute(pending, curve));
  pending.push_back({145, 0});
  EXPECT_TRUE(interp.recompute(pending, curve));
  EXPECT_EQ(2, fitter.calls);
}

}  // namespace
