#include "point_file.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <sstream>

std::string encode_points(const PointList& pts){
    std::ostringstream o;
    for (const auto& p : pts) o << p.x << ',' << p.y << '\n';
    return o.str();
}

PointList decode_points(const std::string& text, const std::string& origin){
    PointList out;
    std::istringstream in(text);
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)){
        lineno++;
        if (trim(line).empty()) continue;
        auto c1 = line.find(',');
        if (c1 == std::string::npos)
            throw FileError(origin + ":" + std::to_string(lineno) + ": expected at least two columns");
        auto c2 = line.find(',', c1 + 1);
        auto x = parse_int(line.substr(0, c1));
        auto y = parse_int(c2 == std::string::npos ? line.substr(c1 + 1) : line.substr(c1 + 1, c2 - c1 - 1));
        if (!x || !y)
            throw FileError(origin + ":" + std::to_string(lineno) + ": non-integer coordinate '" + trim(line) + "'");
        out.push_back({*x, *y});
    }
    return out;
}

void save_points(const std::string& path, const PointList& pts){
    try {
        write_file(path, encode_points(pts));
    } catch (const std::runtime_error& ex) {
        throw FileError(ex.what());
    }
}

PointList load_points(const std::string& path){
    std::string text;
    try {
        text = read_file(path);
    } catch (const std::runtime_error& ex) {
        throw FileError(ex.what());
    }
    return decode_points(text, path);
}
