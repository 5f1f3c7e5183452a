#include "degree.hpp"
#include "debug.hpp"

DegreeMap computeDegrees(const Graph& graph) {
    DegreeMap degrees;
    for (const auto& v : graph.vertices) {
        degrees[v.label] = 0;
    }
    for (const auto& e : graph.edges) {
        ++degrees[graph.vertices[e.u].label];
        ++degrees[graph.vertices[e.v].label];
    }
    return degrees;
}

bool diracCondition(const DegreeMap& degrees, size_t n) {
    if (n < 3 || degrees.empty()) return false;
    double half = static_cast<double>(n) / 2.0;
    for (const auto& [label, deg] : degrees) {
        if (static_cast<double>(deg) < half) {
            DBG("Dirac fails at " << label << ": degree " << deg << " < " << half);
            return false;
        }
    }
    return true;
}

DegreeReport evaluateDegrees(const Graph& graph) {
    DegreeReport report;
    report.degrees = computeDegrees(graph);
    report.dirac = diracCondition(report.degrees, graph.size());
    return report;
}
