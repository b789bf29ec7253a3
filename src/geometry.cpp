#include "geometry.h"
#include <algorithm>
#include <cmath>

namespace klepcbgen {

double clamp_to_span(double v, double lo, double hi) {
    if (lo > hi) std::swap(lo, hi);
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

double snap_to_grid(double v, double grid) {
    if (grid <= 0.0) return v;
    return std::round(v / grid) * grid;
}

std::vector<Segment> rect_outline(const Point& a, const Point& b,
                                  double width, const std::string& layer) {
    Point c1(b.x, a.y);
    Point c2(a.x, b.y);
    std::vector<Segment> segs;
    segs.push_back({a, c1, width, layer});
    segs.push_back({c1, b, width, layer});
    segs.push_back({b, c2, width, layer});
    segs.push_back({c2, a, width, layer});
    return segs;
}

} // namespace klepcbgen
