#include "planner.hpp"
#include "graph.hpp"
#include "heuristic.hpp"
#include "layout.hpp"
#include "route.hpp"
#include "debug.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

const Route& DeliveryPlan::highlightedRoute() const {
    return highlightsHamiltonian() ? hamiltonian.route : heuristicRoute;
}

bool DeliveryPlan::highlightsHamiltonian() const {
    return hamiltonian.status == HamiltonianStatus::Found;
}

void validateConfig(const PlannerConfig& config) {
    if (config.numPoints < MIN_POINTS || config.numPoints > MAX_POINTS) {
        throw std::invalid_argument("Number of locations must be in [" + std::to_string(MIN_POINTS)
            + ", " + std::to_string(MAX_POINTS) + "], got " + std::to_string(config.numPoints));
    }
    if (!std::isfinite(config.radius) || config.radius <= 0.0 || config.radius > MAX_RADIUS) {
        throw std::invalid_argument("Radius must be in (0, 1], got " + std::to_string(config.radius));
    }
    if (config.start < 'A' || config.start >= labelOf(config.numPoints)) {
        throw std::invalid_argument(std::string("Start label ") + config.start
            + " is not one of the " + std::to_string(config.numPoints) + " locations");
    }
}

bool radiusRecommended(double radius) {
    return radius > RECOMMENDED_RADIUS_MIN && radius <= RECOMMENDED_RADIUS_MAX;
}

DeliveryPlan planDelivery(const PlannerConfig& config) {
    validateConfig(config);

    DeliveryPlan plan;
    plan.config = config;

    // Step 1: Lay out the locations and connect the close ones
    LayoutRng rng(config.seed);
    plan.graph = buildGraph(config.numPoints, config.radius, rng);
    plan.farPairs = farPairs(plan.graph);

    // Step 2: Degrees and Dirac's condition
    plan.degrees = evaluateDegrees(plan.graph);

    // Step 3: Exact search, bounded by MAX_EXACT_VERTICES
    plan.hamiltonian = findHamiltonianCycle(plan.graph);
    if (plan.hamiltonian.status == HamiltonianStatus::Found) {
        plan.hamiltonianDistance = routeDistance(plan.hamiltonian.route, plan.graph);
    }

    // Step 4: Greedy geometric tour for comparison
    plan.heuristicRoute = nearestNeighborRoute(plan.graph, config.start);
    plan.heuristicDistance = routeDistance(plan.heuristicRoute, plan.graph);

    DBG("Plan: dirac=" << plan.degrees.dirac
        << " hamiltonian=" << toString(plan.hamiltonian.status)
        << " heuristic=" << plan.heuristicDistance);
    return plan;
}
