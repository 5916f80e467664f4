#include "session.hpp"
#include "config.hpp"
#include "outlier_filter.hpp"
#include "point_file.hpp"
#include <algorithm>

SessionController::SessionController(const Parameters& p, CurveFitter& fitter, DensityClusterer& clusterer)
    : interpolator_(fitter, p.length, p.breadth, p.spline_maximum_points, p.spline_minimum_distance, p.spline_maximum_distance),
      clusterer_(clusterer), eps_(p.eps), min_neighbours_(p.minimum_neighbours) {}

void SessionController::add_coordinate(const Coordinate& c){
    state_.last = c;
    if (state_.mode == SessionMode::Freehand){
        state_.finalized.push_back(c);
        return;
    }
    auto& pending = state_.pending;
    if (std::find(pending.begin(), pending.end(), c) != pending.end()) return;
    pending.push_back(c);
    interpolator_.recompute(pending, state_.interpolated);
}

void SessionController::merge(){
    auto& f = state_.finalized;
    f.insert(f.end(), state_.pending.begin(), state_.pending.end());
    f.insert(f.end(), state_.interpolated.begin(), state_.interpolated.end());
    state_.pending.clear();
    state_.interpolated.clear();
}

void SessionController::leave_interpolation(){
    merge();
    state_.mode = SessionMode::Freehand;
}

void SessionController::toggle_interpolate(){
    if (state_.mode == SessionMode::Freehand){
        state_.mode = SessionMode::Interpolating;
        return;
    }
    leave_interpolation();
}

void SessionController::clear(){
    state_.finalized.clear();
    state_.pending.clear();
    state_.interpolated.clear();
    state_.generation++;
}

size_t SessionController::remove_outliers(){
    leave_interpolation();
    size_t before = state_.finalized.size();
    state_.finalized = ::remove_outliers(state_.finalized, clusterer_, eps_, min_neighbours_);
    return before - state_.finalized.size();
}

void SessionController::save(const std::string& path){
    leave_interpolation();
    save_points(path, state_.finalized);
}

size_t SessionController::import(const std::string& path){
    leave_interpolation();
    // load fully before touching the finalized set
    PointList loaded = load_points(path);
    state_.finalized = std::move(loaded);
    return state_.finalized.size();
}
