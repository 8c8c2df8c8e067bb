#ifndef NAIVE_SIMULATION_H
#define NAIVE_SIMULATION_H

#include "core.hpp"

#include <vector>

// Exact softened pull of every other body on bodies[i].
Vector direct_acceleration(const std::vector<Body>& bodies, size_t i, double eps);

// direct_acceleration for all bodies, split in contiguous blocks over n_threads.
std::vector<Vector> direct_accelerations(const std::vector<Body>& bodies, double eps, int n_threads = 1);

// Direct O(N^2) simulation, recording a telemetry frame per step.
void naive_simulation(System &universe, int steps, double eps, int n_threads = 1);

#endif
