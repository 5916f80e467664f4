#pragma once
#include "points.hpp"

class DensityClusterer;

// Keeps the points that belong to a dense cluster. A set with no more points than
// `min_neighbours` cannot hold a core point and is returned as is.
PointList remove_outliers(const PointList& pts, DensityClusterer& clusterer, double radius, int min_neighbours);
