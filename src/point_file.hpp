#pragma once
#include <string>
#include "points.hpp"

// flat "x,y" rows, no header
std::string encode_points(const PointList& pts);
// rows need at least two integer columns, extra columns and blank lines are ignored.
// throws FileError naming the offending line
PointList decode_points(const std::string& text, const std::string& origin = "<memory>");

// throw FileError
void save_points(const std::string& path, const PointList& pts);
PointList load_points(const std::string& path);
