#pragma once
#include <vector>
#include "points.hpp"

constexpr int NOISE_LABEL = -1;

class DensityClusterer {
public:
    virtual ~DensityClusterer() = default;
    // one label per input point, cluster ids start at 0, NOISE_LABEL for outliers
    virtual std::vector<int> label(const PointList& points, double radius, int min_neighbours) = 0;
};

// A point is a core point when at least `min_neighbours` other points lie within
// `radius` (inclusive). Clusters grow through core points; border points join the
// first cluster that reaches them.
class Dbscan : public DensityClusterer {
public:
    std::vector<int> label(const PointList& points, double radius, int min_neighbours) override;
};
