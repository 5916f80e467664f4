#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "points.hpp"
#include "geometry.hpp"

class LineSource;
class Clock;

struct AveragerStats {
    uint64_t format_rejects = 0; // shape or parse failures
    uint64_t range_rejects = 0;
    uint64_t accepted = 0;
};

// Pulls lines until `quota` valid coordinates are collected and returns their
// floored mean. Throws AcquisitionStall when no valid sample shows up within
// `timeout`, AcquisitionCancelled once `cancel` is raised.
class Averager {
public:
    Averager(LineSource& src, Clock& clock, const Geometry& geometry, int quota,
             std::chrono::milliseconds timeout,
             std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1));

    Coordinate acquire(const std::atomic<bool>* cancel = nullptr);

    const AveragerStats& stats() const { return stats_; }

private:
    std::optional<Coordinate> resolve(const std::string& line);

    LineSource& src_;
    Clock& clock_;
    Geometry geometry_;
    int quota_;
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds poll_interval_;
    AveragerStats stats_;
};
