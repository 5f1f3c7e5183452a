#pragma once

#include <vector>

#include "structures.hpp"

// ==================== Exact Hamiltonian search ====================

// Largest vertex count the exhaustive search will attempt (n! orderings)
constexpr size_t MAX_EXACT_VERTICES = 9;

enum class HamiltonianStatus { Found, NotFound, NotAttempted };

struct HamiltonianResult {
    HamiltonianStatus status = HamiltonianStatus::NotAttempted;
    Route route; // closed route, only set when status == Found
};

/*
* Lazy lexicographic sequence of the orderings of 0..n-1.
* The first ordering is the identity. next() advances in place and returns
* false once the sequence is exhausted; reset() restarts it.
*/
class PermutationGenerator {
public:
    explicit PermutationGenerator(size_t n);

    const std::vector<size_t>& current() const { return perm_; }
    bool exhausted() const { return exhausted_; }

    bool next();
    void reset();

    // Jump to the last ordering that shares the first depth + 1 entries with
    // the current one, so the following next() leaves that prefix.
    void skipPrefix(size_t depth);

private:
    std::vector<size_t> perm_;
    bool exhausted_;
};

// Name of a status, for logs and reports
const char* toString(HamiltonianStatus status);

// First Hamiltonian cycle in lexicographic vertex order.
// Returns NotAttempted when the graph has more than MAX_EXACT_VERTICES vertices.
HamiltonianResult findHamiltonianCycle(const Graph& graph);
