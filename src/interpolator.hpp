#pragma once
#include "points.hpp"

class CurveFitter;

// drops repeated coordinates, first occurrence wins
PointList dedup_points(const PointList& pts);

class Interpolator {
public:
    Interpolator(CurveFitter& fitter, int length, int breadth, int samples,
                 double min_distance, double max_distance);

    // Rebuilds `curve` from `pending` (pending is deduplicated in place).
    // Curve samples are clamped to the workspace.
    // Returns false when the distance gate kept the previous curve.
    bool recompute(PointList& pending, PointList& curve);

private:
    CurveFitter& fitter_;
    int length_;
    int breadth_;
    int samples_;
    double min_distance_;
    double max_distance_;
};
