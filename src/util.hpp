#pragma once
#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cmath>
#include <cerrno>
#include <cstdlib>
#include <climits>
#include <optional>

inline std::string read_file(const std::string& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + p);
    std::ostringstream ss; ss << f.rdbuf();
    return ss.str();
}

inline void write_file(const std::string& p, const std::string& s) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot open for writing: " + p);
    f << s;
    f.flush();
    if (!f) throw std::runtime_error("write failed: " + p);
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// whole string must be an optionally signed decimal integer (surrounding blanks allowed)
inline std::optional<int> parse_int(const std::string& s) {
    std::string t = trim(s);
    if (t.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || end == t.c_str() || *end != '\0') return std::nullopt;
    if (v < INT_MIN || v > INT_MAX) return std::nullopt;
    return (int)v;
}

inline double sq(double n) { return n * n; }

constexpr double PI = 3.14159265358979323846;

inline double deg_to_rad(double degree) { return degree * PI / 180.0; }

inline double distance_between(double x1, double y1, double x2, double y2) {
    return std::sqrt(sq(x1 - x2) + sq(y1 - y2));
}

// modulo that stays in [0, m) for negative n
inline int wrap(int n, int m) {
    int r = n % m;
    return r < 0 ? r + m : r;
}
