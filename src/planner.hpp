#pragma once

#include <cstdint>
#include <vector>

#include "structures.hpp"
#include "degree.hpp"
#include "hamiltonian.hpp"

// ==================== Delivery planner ====================

// Accepted configuration bounds
constexpr size_t MIN_POINTS = 4;
constexpr size_t MAX_POINTS = 10;
constexpr double MAX_RADIUS = 1.0;

// Radius range the layout was tuned for; values outside it still run
constexpr double RECOMMENDED_RADIUS_MIN = 0.1;
constexpr double RECOMMENDED_RADIUS_MAX = 0.6;

struct PlannerConfig {
    size_t numPoints = 6;
    double radius = 0.3;
    std::int64_t seed = 42;
    Label start = 'A'; // heuristic start vertex
};

// Everything one planning run produces
struct DeliveryPlan {
    PlannerConfig config;
    Graph graph;
    std::vector<FarPair> farPairs;
    DegreeReport degrees;
    HamiltonianResult hamiltonian;
    double hamiltonianDistance = 0.0; // 0 unless a cycle was found
    Route heuristicRoute;
    double heuristicDistance = 0.0;

    // The Hamiltonian cycle when one was found, else the heuristic route
    const Route& highlightedRoute() const;
    bool highlightsHamiltonian() const;
};

// Throws std::invalid_argument when the configuration is out of bounds
void validateConfig(const PlannerConfig& config);

bool radiusRecommended(double radius);

// Validate, build the graph from the seed, then run every evaluation over it
DeliveryPlan planDelivery(const PlannerConfig& config);
