#pragma once
#include <string>
#include "points.hpp"
#include "interpolator.hpp"

struct Parameters;
class CurveFitter;
class DensityClusterer;

class SessionController {
public:
    SessionController(const Parameters& p, CurveFitter& fitter, DensityClusterer& clusterer);

    const SessionState& state() const { return state_; }
    SessionMode mode() const { return state_.mode; }

    // routes a freshly acquired coordinate by mode
    void add_coordinate(const Coordinate& c);

    void toggle_interpolate();
    void clear();

    // these leave interpolation first (merging pending work)
    size_t remove_outliers();               // returns the number of dropped points
    void save(const std::string& path);     // throws FileError
    size_t import(const std::string& path); // throws FileError, replaces the finalized set

private:
    void merge();
    void leave_interpolation();

    SessionState state_;
    Interpolator interpolator_;
    DensityClusterer& clusterer_;
    double eps_;
    int min_neighbours_;
};
