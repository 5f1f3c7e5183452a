#include "hamiltonian.hpp"
#include "graph.hpp"
#include "debug.hpp"

#include <algorithm>
#include <functional>
#include <numeric>

PermutationGenerator::PermutationGenerator(size_t n) : perm_(n), exhausted_(false) {
    reset();
}

bool PermutationGenerator::next() {
    if (exhausted_) return false;
    if (!std::next_permutation(perm_.begin(), perm_.end())) {
        exhausted_ = true;
    }
    return !exhausted_;
}

void PermutationGenerator::reset() {
    std::iota(perm_.begin(), perm_.end(), 0);
    exhausted_ = false;
}

void PermutationGenerator::skipPrefix(size_t depth) {
    if (depth + 1 >= perm_.size()) return;
    // A descending suffix is the last ordering below a prefix
    std::sort(perm_.begin() + depth + 1, perm_.end(), std::greater<size_t>());
}

const char* toString(HamiltonianStatus status) {
    switch (status) {
        case HamiltonianStatus::Found: return "found";
        case HamiltonianStatus::NotFound: return "not found";
        case HamiltonianStatus::NotAttempted: return "not attempted";
    }
    return "unknown";
}

HamiltonianResult findHamiltonianCycle(const Graph& graph) {
    size_t n = graph.size();
    if (n > MAX_EXACT_VERTICES) {
        DBG("Skipping exact search: " << n << " vertices exceeds cap of " << MAX_EXACT_VERTICES);
        return {HamiltonianStatus::NotAttempted, {}};
    }
    if (n < 3) {
        return {HamiltonianStatus::NotFound, {}};
    }

    PermutationGenerator gen(n);
    size_t checked = 0;
    do {
        ++checked;
        const auto& perm = gen.current();

        // First broken leg along the ordering, if any
        size_t broken = n;
        for (size_t i = 0; i + 1 < n; ++i) {
            if (!hasEdge(graph, perm[i], perm[i + 1])) {
                broken = i + 1;
                break;
            }
        }

        if (broken == n) {
            if (hasEdge(graph, perm[n - 1], perm[0])) {
                Route route;
                route.reserve(n + 1);
                for (size_t idx : perm) route.push_back(graph.vertices[idx].label);
                route.push_back(route.front());
                DBG("Hamiltonian cycle found after " << checked << " orderings");
                return {HamiltonianStatus::Found, route};
            }
            continue;
        }

        // Every ordering sharing perm[0..broken] fails the same leg
        gen.skipPrefix(broken);
    } while (gen.next());

    DBG("No Hamiltonian cycle among " << checked << " orderings");
    return {HamiltonianStatus::NotFound, {}};
}
