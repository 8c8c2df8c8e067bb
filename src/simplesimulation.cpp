#include "simplesimulation.hpp"
#include <cmath>
#include <functional>
#include <iostream>
#include <thread>
#include <vector>

#ifndef DEBUG
#define DEBUG false
#endif

Vector direct_acceleration(const std::vector<Body>& bodies, size_t i, double eps) {
    Vector acc(0, 0);
    const Body& body = bodies[i];
    for (size_t j = 0; j < bodies.size(); ++j) {
        if (j == i) {continue;}
        Vector vec = bodies[j].coordinates - body.coordinates;
        double dist = vector_len(vec);
        // Same rule as the tree walk: something exactly on top of us does not pull
        if (dist == 0) {continue;}
        double denom = std::pow(sqr(dist) + sqr(eps), 1.5);
        acc += vec * (G * bodies[j].m / denom);
    }
    return acc;
}

static void direct_force_aux(const std::vector<Body>& bodies,  // Only read
                             std::vector<Vector>& accs,
                             const size_t start, const size_t end, const double eps) {
    // Every thread writes to its own slice of accs, so no locking is needed.
    for (size_t i = start; i < end; i++) {
        accs[i] = direct_acceleration(bodies, i, eps);
    }
}

std::vector<Vector> direct_accelerations(const std::vector<Body>& bodies, double eps, int n_threads) {
    const size_t length = bodies.size();
    std::vector<Vector> accs(length);
    if (n_threads < 1) n_threads = 1;
    const size_t block_size = length / n_threads;
    std::vector<std::thread> workers(n_threads - 1);

    size_t start_block = 0;
    for (int i = 0; i < n_threads - 1; ++i) {
        size_t end_block = start_block + block_size;
        workers[i] = std::thread(direct_force_aux, std::cref(bodies), std::ref(accs),
                                 start_block, end_block, eps);
        start_block = end_block;
    }
    // The calling thread takes the last block, remainder included
    direct_force_aux(bodies, accs, start_block, length, eps);
    for (int i = 0; i < n_threads - 1; ++i) {
        workers[i].join();
    }
    return accs;
}

// Basic simulation algorithm for N bodies in a system.
void naive_simulation(System &universe, int steps, double eps, int n_threads) {
    // Start from a blank slate, with the initial positions as frame 0.
    universe.telemetry.clear();
    universe.record_frame();

    for (int step = 0; step < steps; ++step) {
        // All accelerations come from the same positions, then everybody moves.
        std::vector<Vector> accs = direct_accelerations(universe.bodies, eps, n_threads);
        for (size_t i = 0; i < universe.bodies.size(); ++i) {
            universe.bodies[i].update(accs[i], universe.dt, step);
        }
        universe.record_frame();

        if (DEBUG) {
            std::cout << "Step:" << step << "\n";
            for (const auto& body : universe.bodies) {
                std::cout << universe.dt << "    Body " << body.title
                        << " velocity: (" << body.velocity.data[0]
                        << ", " << body.velocity.data[1] << ")"
                        << " acceleration: (" << body.acceleration.data[0]
                        << ", " << body.acceleration.data[1] << ")\n";
            }
        }
    }
}
