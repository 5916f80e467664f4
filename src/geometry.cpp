#include "geometry.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cmath>

Geometry make_geometry(int length, int breadth, double effectual_angle_deg){
    if (length <= 0 || breadth <= 0)
        throw DegenerateGeometryError("workspace " + std::to_string(length) + "x" + std::to_string(breadth) + " is empty");
    Geometry g;
    g.length = length;
    g.breadth = breadth;
    g.baseline_length = length / (2 * std::sin(deg_to_rad(effectual_angle_deg)));
    g.baseline_breadth = breadth / (2 * std::sin(deg_to_rad(effectual_angle_deg)));
    g.max_length = std::sqrt(sq(g.baseline_length + breadth) + sq(length / 2.0));
    g.max_breadth = std::sqrt(sq(g.baseline_breadth + length) + sq(breadth / 2.0));

    g.anchor_lx = length / 2.0;
    g.anchor_ly = breadth + g.baseline_length;
    g.anchor_bx = length + g.baseline_breadth;
    g.anchor_by = breadth / 2.0;
    return g;
}

Geometry make_geometry(const Parameters& p){
    return make_geometry(p.length, p.breadth, p.effectual_angle);
}

void check_geometry(const Geometry& g){
    if (distance_between(g.anchor_lx, g.anchor_ly, g.anchor_bx, g.anchor_by) == 0.0)
        throw DegenerateGeometryError("sensor anchors coincide, check workspace and angle parameters");
}

bool reading_in_range(const Geometry& g, const DistancePair& d){
    return d.dL >= g.baseline_length && d.dL <= g.max_length &&
           d.dB >= g.baseline_breadth && d.dB <= g.max_breadth;
}

Coordinate trilaterate(const Geometry& g, const DistancePair& d){
    double p = d.dL;
    double u = d.dB;
    double e = distance_between(g.anchor_lx, g.anchor_ly, g.anchor_bx, g.anchor_by);
    if (e == 0.0) throw DegenerateGeometryError("sensor anchors coincide, check workspace and angle parameters");

    // f: distance from anchor L along the center line, h: perpendicular offset
    double f = (sq(p) - sq(u) + sq(e)) / (2 * e);
    double h2 = sq(p) - sq(f);
    if (h2 < 0) throw RangeError("distances " + std::to_string(d.dL) + "," + std::to_string(d.dB) + " do not intersect");
    double h = std::sqrt(h2);

    double dx = g.anchor_bx - g.anchor_lx;
    double dy = g.anchor_by - g.anchor_ly;
    int x = (int)((f / e) * dx + (h / e) * dy + g.anchor_lx);
    int y = (int)((f / e) * dy - (h / e) * dx + g.anchor_ly);
    return {wrap(x, g.length), wrap(y, g.breadth)};
}
