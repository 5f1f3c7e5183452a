#pragma once

#include <utility>
#include <cmath>
#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>

#include "structures.hpp"

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

// Aliases
typedef bg::model::box<Point> Box;

typedef std::pair<Point, size_t> PointValue;

// ==================== Geometry helpers ====================

// Axis-aligned box of half-width r around p, padded slightly for precision
Box radiusBox(const Point& p, double r);

// Full-precision Euclidean distance
double pointDistance(const Point& a, const Point& b);

// Round to a fixed number of decimals, for presentation only
double roundTo(double value, int places);
