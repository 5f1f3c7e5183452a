#include "graph.hpp"
#include "debug.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

// Size of the label alphabet
constexpr size_t MAX_LABELS = 26;

Label labelOf(size_t index) {
    return static_cast<Label>('A' + index);
}

size_t vertexIndex(const Graph& graph, Label label) {
    for (size_t i = 0; i < graph.vertices.size(); ++i) {
        if (graph.vertices[i].label == label) return i;
    }
    throw std::out_of_range(std::string("Unknown vertex label: ") + label);
}

Graph buildGraph(const std::vector<Point>& points, double radius) {
    if (!(radius > 0.0) || !std::isfinite(radius)) {
        throw std::invalid_argument("Radius must be a positive finite number");
    }
    if (points.size() > MAX_LABELS) {
        throw std::invalid_argument("Too many points: " + std::to_string(points.size()));
    }

    size_t n = points.size();
    Graph graph;
    graph.radius = radius;
    graph.vertices.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        graph.vertices.push_back({labelOf(i), points[i]});
    }
    graph.adjacency.resize(n);

    // Construct an R*-tree from the points for the radius queries
    bgi::rtree<PointValue, bgi::rstar<16>> rtree;
    for (size_t i = 0; i < n; ++i) {
        rtree.insert(std::make_pair(points[i], i));
    }

    for (size_t i = 0; i < n; ++i) {
        std::vector<PointValue> candidates;
        rtree.query(bgi::intersects(radiusBox(points[i], radius)), std::back_inserter(candidates));
        for (const auto& c : candidates) {
            size_t j = c.second;
            if (j <= i) continue; // each unordered pair once, no self-loops
            double d = pointDistance(points[i], points[j]);
            if (d <= radius) {
                graph.edges.push_back({i, j, d});
            }
        }
    }

    // R-tree results come back in tree order; fix the edge order
    std::sort(graph.edges.begin(), graph.edges.end(), [](const Edge& a, const Edge& b) {
        return a.u != b.u ? a.u < b.u : a.v < b.v;
    });
    for (const auto& e : graph.edges) {
        graph.adjacency[e.u].insert(e.v);
        graph.adjacency[e.v].insert(e.u);
    }

    DBG("Built graph with " << n << " vertices and " << graph.edges.size()
        << " edges (radius " << radius << ")");
    return graph;
}

Graph buildGraph(size_t n, double radius, LayoutRng& rng) {
    return buildGraph(generatePoints(n, rng), radius);
}

bool hasEdge(const Graph& graph, size_t u, size_t v) {
    if (u >= graph.adjacency.size()) return false;
    return graph.adjacency[u].contains(v);
}

std::vector<FarPair> farPairs(const Graph& graph) {
    std::vector<FarPair> pairs;
    size_t n = graph.size();
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (hasEdge(graph, i, j)) continue;
            pairs.push_back({i, j, pointDistance(graph.vertices[i].pos, graph.vertices[j].pos)});
        }
    }
    return pairs;
}
