#pragma once
#include <string>

// units: length = mm, angle = degree, delay = ms
struct Parameters {
    // proximity sensor
    double effectual_angle = 15;
    int minimum_distance = 20;
    int maximum_distance = 4000;

    // workspace
    int length = 0;
    int breadth = 0;

    // display, pixels per mm
    double scale_length = 1.0;
    double scale_breadth = 1.0;

    // readings
    int average_of = 1;
    int delay_ms = 0;
    int timeout_ms = 5000;

    // spline interpolation
    int spline_maximum_points = 100;
    double spline_minimum_distance = 0;
    double spline_maximum_distance = 1e9;

    // dbscan
    double eps = 10;
    int minimum_neighbours = 4;

    // serial
    std::string port;
    int baud = 9600;
};

Parameters parse_parameters(const std::string& json);
Parameters load_parameters(const std::string& path);
