#include "averager.hpp"
#include "clock.hpp"
#include "errors.hpp"
#include "line_source.hpp"
#include "sample_parser.hpp"
#include <stdexcept>
#include <string>

Averager::Averager(LineSource& src, Clock& clock, const Geometry& geometry, int quota,
                   std::chrono::milliseconds timeout, std::chrono::milliseconds poll_interval)
    : src_(src), clock_(clock), geometry_(geometry), quota_(quota),
      timeout_(timeout), poll_interval_(poll_interval) {
    if (quota_ <= 0) throw std::invalid_argument("averager quota must be positive");
}

std::optional<Coordinate> Averager::resolve(const std::string& line){
    auto d = parse_sample(line);
    if (!d) { stats_.format_rejects++; return std::nullopt; }
    if (!reading_in_range(geometry_, *d)) { stats_.range_rejects++; return std::nullopt; }
    try {
        Coordinate c = trilaterate(geometry_, *d);
        stats_.accepted++;
        return c;
    } catch (const RangeError&) {
        stats_.range_rejects++;
        return std::nullopt;
    }
}

Coordinate Averager::acquire(const std::atomic<bool>* cancel){
    long sum_x = 0, sum_y = 0;
    int valid = 0;
    auto deadline = clock_.now() + timeout_;
    while (valid < quota_){
        if (cancel && cancel->load()) throw AcquisitionCancelled("acquisition cancelled");
        if (clock_.now() >= deadline)
            throw AcquisitionStall("no valid reading within " + std::to_string(timeout_.count()) +
                                   " ms (" + std::to_string(valid) + "/" + std::to_string(quota_) + " collected)");
        auto line = src_.poll_line();
        if (!line){
            clock_.sleep_for(poll_interval_);
            continue;
        }
        auto c = resolve(*line);
        if (!c) continue;
        sum_x += c->x;
        sum_y += c->y;
        valid++;
        deadline = clock_.now() + timeout_;
    }
    return {(int)(sum_x / quota_), (int)(sum_y / quota_)};
}
