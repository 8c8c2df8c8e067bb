#include "barneshutt.hpp"
#include "simplesimulation.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

#ifndef DEBUG
#define DEBUG false
#endif

void barnes_hut_simulation(System &universe, int steps, double limit, double eps, QuadTreeOptions options) {
    universe.telemetry.clear();
    universe.record_frame();

    QuadTree tree(universe.bodies, universe.dt, limit, eps, options);
    for (int step = 0; step < steps; ++step) {
        tree.step_forward(step);
        universe.record_frame();

        if (DEBUG) {
            const TraversalStats& stats = tree.lastStepStats();
            std::cout << "Step " << step << ": visited " << stats.visited
                      << ", accepted " << stats.accepted
                      << ", descents " << stats.descents << "\n";
        }
    }
}

AccelerationError acceleration_error(std::vector<Body>& bodies, double limit, double eps, int n_threads) {
    AccelerationError result;
    QuadTree tree(bodies, 0., limit, eps);
    std::vector<Vector> exact = direct_accelerations(bodies, eps, n_threads);

    double sum = 0.;
    for (size_t i = 0; i < bodies.size(); ++i) {
        double reference = vector_len(exact[i]);
        if (reference == 0) continue;
        Vector approx = tree.compute_acceleration(bodies[i]);
        double rel = vector_len(approx - exact[i]) / reference;
        result.maxRelative = std::max(result.maxRelative, rel);
        sum += rel;
        result.compared++;
    }
    if (result.compared > 0) {
        result.meanRelative = sum / result.compared;
    }
    return result;
}
