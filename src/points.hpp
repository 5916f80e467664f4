#pragma once
#include <vector>
#include <cstdint>

struct Coordinate {
    int x = 0;
    int y = 0;
    bool operator==(const Coordinate& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Coordinate& o) const { return !(*this == o); }
};

// raw distances from the two emitters, same unit as the workspace (mm)
struct DistancePair {
    int dL = 0;
    int dB = 0;
};

enum class SessionMode { Freehand, Interpolating };

using PointList = std::vector<Coordinate>;

struct SessionState {
    SessionMode mode = SessionMode::Freehand;
    PointList finalized;
    PointList pending;
    PointList interpolated;
    Coordinate last{};
    uint64_t generation = 0; // bumped on clear, renderer resets its view
};
