#pragma once

#include <string>

#include "structures.hpp"

// ==================== Route evaluation ====================

// Check that route is a closed tour over the graph: n + 1 labels, first == last,
// every vertex exactly once before the closing label.
// With requireEdges, every consecutive pair must also be a graph edge.
bool verifyRoute(const Route& route, const Graph& graph, bool requireEdges = false);

// Sum of consecutive Euclidean distances along the route (full precision).
// Throws std::out_of_range for a label that is not in the graph.
double routeDistance(const Route& route, const Graph& graph);

// "A → B → C → A"
std::string formatRoute(const Route& route);
