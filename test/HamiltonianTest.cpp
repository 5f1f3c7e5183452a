/// Tests for the exact Hamiltonian cycle search:
///   - lexicographic permutation generator and prefix skipping
///   - found / not found / not attempted outcomes
///   - the pruned search returns the same cycle as a plain scan

#include "hamiltonian.hpp"
#include "degree.hpp"
#include "graph.hpp"
#include "layout.hpp"
#include "route.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <numbers>
#include <numeric>
#include <string>
#include <vector>

static std::vector<Point> unitSquare() {
    return {Point(0.0, 0.0), Point(1.0, 0.0), Point(1.0, 1.0), Point(0.0, 1.0)};
}

static std::vector<Point> regularPolygon(size_t k) {
    std::vector<Point> points;
    for (size_t i = 0; i < k; ++i) {
        double a = 2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(k);
        points.emplace_back(0.5 + 0.4 * std::cos(a), 0.5 + 0.4 * std::sin(a));
    }
    return points;
}

// k points on a 4-wide grid with unit spacing scaled to 0.1
static std::vector<Point> grid(size_t k) {
    std::vector<Point> points;
    for (size_t i = 0; i < k; ++i) {
        points.emplace_back(0.1 + 0.1 * static_cast<double>(i % 4), 0.1 + 0.1 * static_cast<double>(i / 4));
    }
    return points;
}

// Reference: every ordering in lexicographic order, no pruning
static HamiltonianResult plainScan(const Graph& g) {
    size_t n = g.size();
    if (n > MAX_EXACT_VERTICES) return {HamiltonianStatus::NotAttempted, {}};
    std::vector<size_t> perm(n);
    std::iota(perm.begin(), perm.end(), 0);
    do {
        bool ok = true;
        for (size_t i = 0; i < n; ++i) {
            if (!hasEdge(g, perm[i], perm[(i + 1) % n])) {
                ok = false;
                break;
            }
        }
        if (ok) {
            Route route;
            for (size_t idx : perm) route.push_back(g.vertices[idx].label);
            route.push_back(route.front());
            return {HamiltonianStatus::Found, route};
        }
    } while (std::next_permutation(perm.begin(), perm.end()));
    return {HamiltonianStatus::NotFound, {}};
}

// ════════════════════════════════════════════════════════════════════
//  Permutation generator
// ════════════════════════════════════════════════════════════════════

static void test_generator_order() {
    std::printf("  generator: lexicographic order for n = 3\n");

    PermutationGenerator gen(3);
    const std::vector<std::vector<size_t>> expected = {
        {0, 1, 2}, {0, 2, 1}, {1, 0, 2}, {1, 2, 0}, {2, 0, 1}, {2, 1, 0}
    };
    for (size_t k = 0; k < expected.size(); ++k) {
        assert(gen.current() == expected[k]);
        bool more = gen.next();
        assert(more == (k + 1 < expected.size()));
    }
    assert(gen.exhausted());
    assert(!gen.next());
}

static void test_generator_restart() {
    std::printf("  generator: reset replays the sequence\n");

    PermutationGenerator gen(4);
    size_t count = 1;
    while (gen.next()) ++count;
    assert(count == 24);

    gen.reset();
    assert(!gen.exhausted());
    assert((gen.current() == std::vector<size_t>{0, 1, 2, 3}));
    count = 1;
    while (gen.next()) ++count;
    assert(count == 24);
}

static void test_generator_skip_prefix() {
    std::printf("  generator: skipPrefix leaves the prefix on next()\n");

    PermutationGenerator gen(4);
    gen.skipPrefix(0);
    assert((gen.current() == std::vector<size_t>{0, 3, 2, 1}));
    assert(gen.next());
    assert((gen.current() == std::vector<size_t>{1, 0, 2, 3}));

    gen.skipPrefix(1);
    assert((gen.current() == std::vector<size_t>{1, 0, 3, 2}));
    assert(gen.next());
    assert((gen.current() == std::vector<size_t>{1, 2, 0, 3}));

    // Prefix covering the whole ordering: nothing to skip
    gen.skipPrefix(3);
    assert((gen.current() == std::vector<size_t>{1, 2, 0, 3}));
}

// ════════════════════════════════════════════════════════════════════
//  Search outcomes
// ════════════════════════════════════════════════════════════════════

static void test_complete_square() {
    std::printf("  complete square: perimeter cycle A B C D A\n");

    Graph g = buildGraph(unitSquare(), 1.5);
    HamiltonianResult r = findHamiltonianCycle(g);
    assert(r.status == HamiltonianStatus::Found);
    assert((r.route == Route{'A', 'B', 'C', 'D', 'A'}));
    assert(verifyRoute(r.route, g, true));
    assert(routeDistance(r.route, g) == 4.0);
}

static void test_perimeter_square() {
    std::printf("  perimeter square: cycle survives without diagonals\n");

    Graph g = buildGraph(unitSquare(), 1.0);
    HamiltonianResult r = findHamiltonianCycle(g);
    assert(r.status == HamiltonianStatus::Found);
    assert(r.route.size() == 5);
    assert((r.route == Route{'A', 'B', 'C', 'D', 'A'}));
    assert(verifyRoute(r.route, g, true));
    assert(routeDistance(r.route, g) == 4.0);
}

static void test_first_in_order_wins() {
    std::printf("  relabelled square: first cycle in label order is A C B D A\n");

    // A and B are opposite corners, so A-B is a diagonal
    std::vector<Point> points = {
        Point(0.0, 0.0), Point(1.0, 1.0), Point(1.0, 0.0), Point(0.0, 1.0)
    };
    Graph g = buildGraph(points, 1.0);
    HamiltonianResult r = findHamiltonianCycle(g);
    assert(r.status == HamiltonianStatus::Found);
    assert((r.route == Route{'A', 'C', 'B', 'D', 'A'}));
    assert(routeDistance(r.route, g) == 4.0);
}

static void test_not_found() {
    std::printf("  chain plus isolated vertex: not found\n");

    std::vector<Point> points = {
        Point(0.0, 0.0), Point(0.1, 0.0), Point(0.2, 0.0), Point(0.9, 0.9)
    };
    HamiltonianResult r = findHamiltonianCycle(buildGraph(points, 0.15));
    assert(r.status == HamiltonianStatus::NotFound);
    assert(r.route.empty());
}

static void test_path_is_not_cycle() {
    std::printf("  Hamiltonian path without closing edge: not found\n");

    // A-B-C-D in a line, consecutive gaps 0.2, ends 0.6 apart
    std::vector<Point> points = {
        Point(0.1, 0.5), Point(0.3, 0.5), Point(0.5, 0.5), Point(0.7, 0.5)
    };
    HamiltonianResult r = findHamiltonianCycle(buildGraph(points, 0.25));
    assert(r.status == HamiltonianStatus::NotFound);
}

static void test_dirac_not_necessary() {
    std::printf("  pentagon: Dirac fails yet a cycle exists\n");

    Graph g = buildGraph(regularPolygon(5), 0.6);
    assert(!evaluateDegrees(g).dirac);
    HamiltonianResult r = findHamiltonianCycle(g);
    assert(r.status == HamiltonianStatus::Found);
    assert((r.route == Route{'A', 'B', 'C', 'D', 'E', 'A'}));
    assert(verifyRoute(r.route, g, true));
}

static void test_nine_vertices_searched() {
    std::printf("  nine vertices, complete: searched and found\n");

    Graph g = buildGraph(grid(9), 2.0);
    HamiltonianResult r = findHamiltonianCycle(g);
    assert(r.status == HamiltonianStatus::Found);
    assert((r.route == Route{'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'A'}));
}

static void test_ten_vertices_not_attempted() {
    std::printf("  ten vertices: not attempted regardless of density\n");

    Graph dense = buildGraph(grid(10), 2.0);
    assert(dense.edges.size() == 45);
    HamiltonianResult r = findHamiltonianCycle(dense);
    assert(r.status == HamiltonianStatus::NotAttempted);
    assert(r.route.empty());

    Graph sparse = buildGraph(grid(10), 0.05);
    assert(findHamiltonianCycle(sparse).status == HamiltonianStatus::NotAttempted);
}

static void test_status_names() {
    std::printf("  status names\n");

    assert(std::string(toString(HamiltonianStatus::Found)) == "found");
    assert(std::string(toString(HamiltonianStatus::NotFound)) == "not found");
    assert(std::string(toString(HamiltonianStatus::NotAttempted)) == "not attempted");
}

// ════════════════════════════════════════════════════════════════════
//  Seeded graphs
// ════════════════════════════════════════════════════════════════════

static void test_matches_plain_scan() {
    std::printf("  pruned search equals plain scan on seeded graphs\n");

    const double radii[] = {0.3, 0.4, 0.5, 0.6};
    size_t found = 0;
    for (std::int64_t seed = 0; seed < 12; ++seed) {
        for (size_t n = 4; n <= 8; ++n) {
            for (double radius : radii) {
                LayoutRng rng(seed);
                Graph g = buildGraph(n, radius, rng);
                HamiltonianResult pruned = findHamiltonianCycle(g);
                HamiltonianResult plain = plainScan(g);
                assert(pruned.status == plain.status);
                assert(pruned.route == plain.route);
                if (pruned.status == HamiltonianStatus::Found) {
                    ++found;
                    assert(pruned.route.size() == n + 1);
                    assert(pruned.route.front() == 'A');
                    assert(verifyRoute(pruned.route, g, true));
                }
            }
        }
    }
    std::printf("    (%zu graphs with a cycle)\n", found);
}

static void test_dirac_implies_found() {
    std::printf("  Dirac's condition implies a cycle is found\n");

    for (std::int64_t seed = 0; seed < 30; ++seed) {
        for (size_t n = 4; n <= 9; ++n) {
            LayoutRng rng(seed);
            Graph g = buildGraph(n, 0.6, rng);
            if (evaluateDegrees(g).dirac) {
                assert(findHamiltonianCycle(g).status == HamiltonianStatus::Found);
            }
        }
    }
}

static void test_repeatable() {
    std::printf("  repeated searches agree\n");

    LayoutRng rng(42);
    Graph g = buildGraph(8, 0.5, rng);
    HamiltonianResult first = findHamiltonianCycle(g);
    HamiltonianResult second = findHamiltonianCycle(g);
    assert(first.status == second.status);
    assert(first.route == second.route);
}

int main() {
    std::printf("=== Hamiltonian tests ===\n\n");

    std::printf("Permutation generator:\n");
    test_generator_order();
    test_generator_restart();
    test_generator_skip_prefix();

    std::printf("\nSearch outcomes:\n");
    test_complete_square();
    test_perimeter_square();
    test_first_in_order_wins();
    test_not_found();
    test_path_is_not_cycle();
    test_dirac_not_necessary();
    test_nine_vertices_searched();
    test_ten_vertices_not_attempted();
    test_status_names();

    std::printf("\nSeeded graphs:\n");
    test_matches_plain_scan();
    test_dirac_implies_found();
    test_repeatable();

    std::printf("\nAll Hamiltonian tests passed.\n");
    return 0;
}
