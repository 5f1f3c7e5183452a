#pragma once

#include <vector>

#include "structures.hpp"
#include "geometry.hpp"
#include "layout.hpp"

// ==================== Proximity graph ====================

// Label of the i-th vertex: 'A' + i
Label labelOf(size_t index);

// Index of the vertex carrying label; throws std::out_of_range if absent
size_t vertexIndex(const Graph& graph, Label label);

// Build the proximity graph over the given points: edge {u, v} iff distance(u, v) <= radius.
// Point i becomes vertex i with label labelOf(i).
// Throws std::invalid_argument for a non-positive radius or more points than labels.
Graph buildGraph(const std::vector<Point>& points, double radius);

// Draw n points from rng, then build the proximity graph over them
Graph buildGraph(size_t n, double radius, LayoutRng& rng);

bool hasEdge(const Graph& graph, size_t u, size_t v);

// Every vertex pair farther apart than the radius, sorted by (u, v)
std::vector<FarPair> farPairs(const Graph& graph);
