#include "interpolator.hpp"
#include "curve_fitter.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

constexpr size_t MIN_CURVE_POINTS = 3;

PointList dedup_points(const PointList& pts){
    PointList out; out.reserve(pts.size());
    for (const auto& p : pts)
        if (std::find(out.begin(), out.end(), p) == out.end()) out.push_back(p);
    return out;
}

Interpolator::Interpolator(CurveFitter& fitter, int length, int breadth, int samples,
                           double min_distance, double max_distance)
    : fitter_(fitter), length_(length), breadth_(breadth), samples_(samples),
      min_distance_(min_distance), max_distance_(max_distance) {
    if (length_ <= 0 || breadth_ <= 0) throw std::invalid_argument("workspace dimensions must be positive");
}

bool Interpolator::recompute(PointList& pending, PointList& curve){
    pending = dedup_points(pending);
    if (pending.size() < MIN_CURVE_POINTS){
        curve.clear();
        return true;
    }

    const Coordinate& a = pending[pending.size() - 1];
    const Coordinate& b = pending[pending.size() - 2];
    double dis = distance_between(a.x, a.y, b.x, b.y);
    if (dis < min_distance_ || dis > max_distance_) return false;

    auto samples = fitter_.fit(pending, samples_);
    curve.clear();
    curve.reserve(samples.size());
    // a degree-2 interpolant overshoots near sharp turns, keep it on the workspace
    for (const auto& s : samples){
        int x = (int)std::lround(s.x);
        int y = (int)std::lround(s.y);
        curve.push_back({std::clamp(x, 0, length_ - 1), std::clamp(y, 0, breadth_ - 1)});
    }
    return true;
}
