#include "planner.hpp"
#include "geometry.hpp"
#include "route.hpp"
#include "settings.hpp"

#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

void printSettings(const Settings& settings) {
    std::cout << "Settings:\n";
    std::cout << "  Number of locations: " << settings.planner.numPoints << "\n";
    std::cout << "  Connection radius: " << settings.planner.radius << "\n";
    std::cout << "  Seed: " << settings.planner.seed << "\n";
    std::cout << "  Heuristic start: " << settings.planner.start << "\n";
    std::cout << "  Log file: " << (settings.logFile ? settings.logFile->string() : "stdout") << "\n";
}

void printPlan(const DeliveryPlan& plan, std::ostream& out) {
    const Graph& g = plan.graph;

    out << "Delivery locations: " << g.size() << "\n";
    out << std::fixed << std::setprecision(4);
    for (const auto& v : g.vertices) {
        out << "  " << v.label << " (" << bg::get<0>(v.pos) << ", " << bg::get<1>(v.pos) << ")\n";
    }

    out << std::setprecision(2);
    out << "Connected roads: " << g.edges.size() << "\n";
    for (const auto& e : g.edges) {
        out << "  " << g.vertices[e.u].label << "-" << g.vertices[e.v].label
            << " " << e.displayWeight() << "\n";
    }
    out << "Too far to connect: " << plan.farPairs.size() << "\n";
    for (const auto& p : plan.farPairs) {
        out << "  " << g.vertices[p.u].label << "-" << g.vertices[p.v].label
            << " " << roundTo(p.length, 2) << "\n";
    }

    out << "Degrees:";
    for (const auto& [label, deg] : plan.degrees.degrees) {
        out << " " << label << "=" << deg;
    }
    out << "\n";
    out << "Dirac's condition: " << (plan.degrees.dirac ? "satisfied" : "not satisfied") << "\n";

    out << std::setprecision(3);
    switch (plan.hamiltonian.status) {
        case HamiltonianStatus::Found:
            out << "Hamiltonian route: " << formatRoute(plan.hamiltonian.route) << "\n";
            out << "  Total distance: " << roundTo(plan.hamiltonianDistance, 3) << "\n";
            break;
        case HamiltonianStatus::NotFound:
            out << "Hamiltonian route: none, the network isn't dense enough\n";
            break;
        case HamiltonianStatus::NotAttempted:
            out << "Hamiltonian route: not attempted (more than "
                << MAX_EXACT_VERTICES << " locations)\n";
            break;
    }

    out << "Heuristic route: " << formatRoute(plan.heuristicRoute) << "\n";
    out << "  Total distance: " << roundTo(plan.heuristicDistance, 3) << "\n";
    out << "Highlighted: " << (plan.highlightsHamiltonian() ? "Hamiltonian cycle" : "heuristic route")
        << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    try {
        // Load settings
        std::string settingsFile = argc > 1 ? argv[1] : "settings.txt";
        Settings settings = loadSettings(settingsFile);
        printSettings(settings);

        // Set up logging
        std::ofstream logFile;
        std::ostream& logStream = [&]() -> std::ostream& {
            if (settings.logFile) {
                logFile.open(*settings.logFile); // overwrite mode
                if (logFile) {
                    return logFile;
                } else {
                    std::cerr << "Failed to open log file. Falling back to stdout.\n";
                }
            }
            return std::cout;
        }();

        // Reject a bad configuration before any note about it is logged
        validateConfig(settings.planner);
        if (!radiusRecommended(settings.planner.radius)) {
            logStream << "Note: radius " << settings.planner.radius << " is outside the recommended range ("
                      << RECOMMENDED_RADIUS_MIN << ", " << RECOMMENDED_RADIUS_MAX << "]\n";
        }

        auto startTime = std::chrono::high_resolution_clock::now();
        DeliveryPlan plan = planDelivery(settings.planner);
        auto endTime = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime).count();

        printPlan(plan, logStream);
        logStream << "Planned in " << duration << " us\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
