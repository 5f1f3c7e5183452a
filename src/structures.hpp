#pragma once

#include <cstddef>
#include <unordered_set>
#include <vector>
#include <absl/container/flat_hash_set.h>
#include <boost/geometry.hpp>

// Choose Abseil or std hash set
#if USE_ABSEIL_HASH_SET
template<typename T>
using HashSet = absl::flat_hash_set<T>;
#else
template<typename T>
using HashSet = std::unordered_set<T>;
#endif

namespace bg = boost::geometry;

typedef bg::model::point<double, 2, bg::cs::cartesian> Point;

// Vertex labels come from the ordered alphabet A, B, C, ...
typedef char Label;

// A closed tour of labels: n + 1 entries, first == last.
typedef std::vector<Label> Route;

// ==================== Structures ====================

// Delivery location. The vertex index in Graph::vertices is the label order.
struct Vertex {
    Label label;
    Point pos;
};

/*
* Undirected proximity edge between vertices u < v.
* length is kept at full precision; only displayWeight() rounds.
*/
struct Edge {
    size_t u, v;
    double length;

    double displayWeight() const;
};

// Pair of vertices farther apart than the radius ("too far to connect")
struct FarPair {
    size_t u, v;
    double length;
};

/*
* Proximity graph over a fixed vertex set.
* Edges are sorted by (u, v); adjacency[i] holds the neighbours of vertex i.
* Built once by buildGraph() and never mutated afterwards.
*/
struct Graph {
    std::vector<Vertex> vertices;
    std::vector<Edge> edges;
    std::vector<HashSet<size_t>> adjacency;
    double radius = 0.0;

    size_t size() const { return vertices.size(); }
};
