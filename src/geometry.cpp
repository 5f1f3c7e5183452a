#include "geometry.hpp"

Box radiusBox(const Point& p, double r) {
    double adjr = r + 1e-12; // Add a small epsilon to avoid precision issues
    return Box(
        Point(bg::get<0>(p) - adjr, bg::get<1>(p) - adjr),
        Point(bg::get<0>(p) + adjr, bg::get<1>(p) + adjr)
    );
}

double pointDistance(const Point& a, const Point& b) {
    return bg::distance(a, b);
}

double roundTo(double value, int places) {
    double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

double Edge::displayWeight() const {
    return roundTo(length, 2);
}
