#include "outlier_filter.hpp"
#include "density_clusterer.hpp"
#include <cstddef>

PointList remove_outliers(const PointList& pts, DensityClusterer& clusterer, double radius, int min_neighbours){
    if ((int)pts.size() <= min_neighbours) return pts;
    auto labels = clusterer.label(pts, radius, min_neighbours);
    PointList inliers; inliers.reserve(pts.size());
    for (std::size_t i = 0; i < pts.size(); ++i)
        if (labels[i] != NOISE_LABEL) inliers.push_back(pts[i]);
    return inliers;
}
