#pragma once

#include "core.hpp"
#include "quadtree.hpp"

#include <vector>

struct AccelerationError {
    double maxRelative = 0.;
    double meanRelative = 0.;
    size_t compared = 0; // bodies with a non-zero exact acceleration
};

// Records frame 0, then runs `steps` frames of QuadTree::step_forward,
// recording a frame after each one.
void barnes_hut_simulation(System &universe, int steps, double limit, double eps,
                           QuadTreeOptions options = QuadTreeOptions());

// Relative error |a_bh - a_direct| / |a_direct| of a freshly built tree
// against direct summation, for the current positions.
AccelerationError acceleration_error(std::vector<Body>& bodies, double limit, double eps, int n_threads = 1);
