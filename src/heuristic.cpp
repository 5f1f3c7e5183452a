#include "heuristic.hpp"
#include "geometry.hpp"
#include "graph.hpp"
#include "debug.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

Route nearestNeighborRouteFrom(const Graph& graph, size_t start) {
    size_t n = graph.size();
    if (start >= n) {
        throw std::out_of_range("Start vertex " + std::to_string(start) + " out of range");
    }

    std::vector<bool> visited(n, false);
    Route route;
    route.reserve(n + 1);

    size_t current = start;
    visited[current] = true;
    route.push_back(graph.vertices[current].label);

    for (size_t step = 1; step < n; ++step) {
        size_t nn = static_cast<size_t>(-1);
        double best = std::numeric_limits<double>::infinity();
        for (size_t j = 0; j < n; ++j) {
            if (visited[j]) continue;
            double d = pointDistance(graph.vertices[current].pos, graph.vertices[j].pos);
            if (d < best) { // strict, so the lower label wins ties
                best = d;
                nn = j;
            }
        }
        visited[nn] = true;
        route.push_back(graph.vertices[nn].label);
        DBG_NOENDL(graph.vertices[current].label << "->" << graph.vertices[nn].label << " ");
        current = nn;
    }

    route.push_back(graph.vertices[start].label);
    DBG("");
    return route;
}

Route nearestNeighborRoute(const Graph& graph, Label start) {
    return nearestNeighborRouteFrom(graph, vertexIndex(graph, start));
}
