#pragma once

#include <cmath>
#include <vector>
#include <string>

namespace klepcbgen {

struct Point {
    double x = 0.0;
    double y = 0.0;

    Point() = default;
    Point(double x, double y) : x(x), y(y) {}

    Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    Point operator*(double s) const { return {x * s, y * s}; }
    bool operator==(const Point& o) const {
        return std::abs(x - o.x) < 1e-6 && std::abs(y - o.y) < 1e-6;
    }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

// Limit v to the closed interval [lo, hi]
double clamp_to_span(double v, double lo, double hi);

// Round a value to the nearest multiple of grid
double snap_to_grid(double v, double grid);

// Axis-aligned rectangle outline as four closed segments
struct Segment {
    Point start, end;
    double width = 0.0;
    std::string layer;
};

std::vector<Segment> rect_outline(const Point& a, const Point& b,
                                  double width, const std::string& layer);

} // namespace klepcbgen
