#pragma once

#include <map>

#include "structures.hpp"

// ==================== Degree / Dirac ====================

// Incident-edge count per vertex label
typedef std::map<Label, size_t> DegreeMap;

struct DegreeReport {
    DegreeMap degrees;
    bool dirac = false; // every degree >= n/2 with n >= 3
};

DegreeMap computeDegrees(const Graph& graph);

// Dirac's sufficient condition for n vertices: n >= 3 and min degree >= n/2 (real division).
// An empty map never satisfies it.
bool diracCondition(const DegreeMap& degrees, size_t n);

DegreeReport evaluateDegrees(const Graph& graph);
