#include "config.hpp"
#include "util.hpp"
#include <stdexcept>

extern "C" {
#include <json-c/json.h>
}

Parameters parse_parameters(const std::string& s){
    json_object* root = json_tokener_parse(s.c_str());
    if (!root) throw std::runtime_error("parameters parse error");

    auto group=[&](const char* g)->json_object*{
        json_object* v=nullptr;
        if(!json_object_object_get_ex(root,g,&v) || !json_object_is_type(v, json_type_object)) return nullptr;
        return v;
    };
    auto getS=[&](json_object* o, const char* k, const std::string& def)->std::string{
        json_object* v=nullptr;
        if(!o || !json_object_object_get_ex(o,k,&v)) return def;
        const char* t = json_object_get_string(v);
        return t? std::string(t) : def;
    };
    auto getI=[&](json_object* o, const char* k, int def)->int{
        json_object* v=nullptr;
        if(!o || !json_object_object_get_ex(o,k,&v)) return def;
        return json_object_get_int(v);
    };
    auto getD=[&](json_object* o, const char* k, double def)->double{
        json_object* v=nullptr;
        if(!o || !json_object_object_get_ex(o,k,&v)) return def;
        return json_object_get_double(v);
    };

    Parameters p{};
    json_object* sensor = group("proximity sensor");
    p.effectual_angle = getD(sensor, "effectual angle", p.effectual_angle);
    p.minimum_distance = getI(sensor, "minimum distance", p.minimum_distance);
    p.maximum_distance = getI(sensor, "maximum distance", p.maximum_distance);

    json_object* ws = group("workspace");
    p.length = getI(ws, "length", 0);
    p.breadth = getI(ws, "breadth", 0);

    json_object* scale = group("scale");
    p.scale_length = getD(scale, "length", p.scale_length);
    p.scale_breadth = getD(scale, "breadth", p.scale_breadth);

    json_object* readings = group("readings");
    p.average_of = getI(readings, "average of", p.average_of);
    p.delay_ms = getI(readings, "delay", p.delay_ms);
    p.timeout_ms = getI(readings, "timeout", p.timeout_ms);

    json_object* spline = group("spline interpolation");
    p.spline_maximum_points = getI(spline, "maximum points", p.spline_maximum_points);
    p.spline_minimum_distance = getD(spline, "minimum distance", p.spline_minimum_distance);
    p.spline_maximum_distance = getD(spline, "maximum distance", p.spline_maximum_distance);

    json_object* dbscan = group("dbscan");
    p.eps = getD(dbscan, "eps", p.eps);
    json_object* unused=nullptr;
    if (dbscan && !json_object_object_get_ex(dbscan, "minimum neighbours", &unused) &&
        json_object_object_get_ex(dbscan, "minimum samples", &unused)){
        // older files count the point itself
        p.minimum_neighbours = getI(dbscan, "minimum samples", 0) - 1;
    } else {
        p.minimum_neighbours = getI(dbscan, "minimum neighbours", p.minimum_neighbours);
    }

    json_object* serial = group("serial");
    p.port = getS(serial, "port", "");
    p.baud = getI(serial, "baud", p.baud);

    bool has_ws = ws != nullptr;
    json_object_put(root);

    if (!has_ws) throw std::runtime_error("parameters missing workspace group");
    if (p.length <= 0 || p.breadth <= 0) throw std::runtime_error("workspace length and breadth must be positive");
    if (p.effectual_angle <= 0 || p.effectual_angle >= 180) throw std::runtime_error("effectual angle must be in (0, 180)");
    if (p.average_of <= 0) throw std::runtime_error("readings.average of must be positive");
    if (p.timeout_ms <= 0) throw std::runtime_error("readings.timeout must be positive");
    if (p.delay_ms < 0) throw std::runtime_error("readings.delay must not be negative");
    if (p.spline_maximum_points < 2) throw std::runtime_error("spline interpolation.maximum points must be at least 2");
    if (p.eps < 0 || p.minimum_neighbours < 0) throw std::runtime_error("dbscan parameters must not be negative");
    if (p.scale_length <= 0 || p.scale_breadth <= 0) throw std::runtime_error("scale must be positive");
    if (p.port.empty()) throw std::runtime_error("parameters missing serial.port");
    return p;
}

Parameters load_parameters(const std::string& path){
    return parse_parameters(read_file(path));
}
