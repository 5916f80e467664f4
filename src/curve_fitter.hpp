#pragma once
#include <vector>
#include "points.hpp"

struct CurveSample { double x; double y; };

class CurveFitter {
public:
    virtual ~CurveFitter() = default;
    // points: ordered, unique. Returns `samples` points along a curve through all of them.
    virtual std::vector<CurveSample> fit(const PointList& points, int samples) = 0;
};

// Interpolating parametric B-spline, zero smoothing. Parameter values follow the
// normalized cumulative chord length; for even degree the interior knots sit
// halfway between consecutive parameter values.
class BSplineFitter : public CurveFitter {
public:
    explicit BSplineFitter(int degree = 2);
    std::vector<CurveSample> fit(const PointList& points, int samples) override;

private:
    int degree_;
};

// helpers exposed for tests
std::vector<double> chord_length_parameters(const PointList& points);
std::vector<double> interpolation_knots(const std::vector<double>& u, int degree);
