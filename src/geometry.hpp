#pragma once
#include "points.hpp"

struct Parameters;

// Fixed model of the rig, derived once from the workspace and the sensor angle.
// Anchor L sits above the workspace (centered on the length axis), anchor B to
// its right (centered on the breadth axis), each pushed out by its baseline.
struct Geometry {
    int length = 0;
    int breadth = 0;
    double baseline_length = 0;  // distance from the workspace edge to anchor L
    double baseline_breadth = 0; // distance from the workspace edge to anchor B
    double max_length = 0;
    double max_breadth = 0;

    double anchor_lx = 0, anchor_ly = 0;
    double anchor_bx = 0, anchor_by = 0;
};

// throws DegenerateGeometryError for a non-positive workspace
Geometry make_geometry(int length, int breadth, double effectual_angle_deg);
Geometry make_geometry(const Parameters& p);

// throws DegenerateGeometryError when the anchors coincide
void check_geometry(const Geometry& g);

bool reading_in_range(const Geometry& g, const DistancePair& d);

// throws DegenerateGeometryError when the anchors coincide,
// RangeError when the two circles do not intersect
Coordinate trilaterate(const Geometry& g, const DistancePair& d);
