#pragma once

#include "structures.hpp"

// ==================== Nearest-neighbour route ====================

// Greedy geometric tour from start: always move to the closest unvisited vertex,
// lower label first on ties. Ignores graph edges, so it always succeeds.
// Throws std::out_of_range if start is not a vertex of the graph.
Route nearestNeighborRouteFrom(const Graph& graph, size_t start);

// Same tour, starting from the vertex with the given label
Route nearestNeighborRoute(const Graph& graph, Label start);
