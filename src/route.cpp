#include "route.hpp"
#include "geometry.hpp"
#include "graph.hpp"
#include "debug.hpp"

#include <vector>

bool verifyRoute(const Route& route, const Graph& graph, bool requireEdges) {
    size_t n = graph.size();
    if (n == 0 || route.size() != n + 1) {
        DBG("Route has " << route.size() << " labels, expected " << n + 1);
        return false;
    }
    if (route.front() != route.back()) {
        DBG("Route is not closed");
        return false;
    }

    std::vector<size_t> indices;
    indices.reserve(route.size());
    for (Label l : route) {
        bool known = false;
        for (size_t i = 0; i < n; ++i) {
            if (graph.vertices[i].label == l) {
                indices.push_back(i);
                known = true;
                break;
            }
        }
        if (!known) {
            DBG("Route visits unknown label " << l);
            return false;
        }
    }

    std::vector<bool> seen(n, false);
    for (size_t k = 0; k < n; ++k) {
        if (seen[indices[k]]) {
            DBG("Route visits " << route[k] << " twice");
            return false;
        }
        seen[indices[k]] = true;
    }

    if (requireEdges) {
        for (size_t k = 0; k < n; ++k) {
            if (!hasEdge(graph, indices[k], indices[k + 1])) {
                DBG("Route leg " << route[k] << "-" << route[k + 1] << " is not an edge");
                return false;
            }
        }
    }
    return true;
}

double routeDistance(const Route& route, const Graph& graph) {
    double totalDist = 0.0;
    for (size_t i = 0; i + 1 < route.size(); ++i) {
        const Point& p1 = graph.vertices[vertexIndex(graph, route[i])].pos;
        const Point& p2 = graph.vertices[vertexIndex(graph, route[i + 1])].pos;
        totalDist += pointDistance(p1, p2);
    }
    return totalDist;
}

std::string formatRoute(const Route& route) {
    std::string out;
    for (size_t i = 0; i < route.size(); ++i) {
        if (i > 0) out += " → ";
        out += route[i];
    }
    return out;
}
