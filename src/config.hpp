#pragma once

#include "core.hpp"

#include <string>

#ifndef ASTEROIDS
#define ASTEROIDS 200
#endif

#ifndef N_THREADS
#define N_THREADS 5
#endif

// Everything main.cpp can be told from the command line.
struct SimulationConfig {
    std::string method = "barneshut";   // barneshut | naive
    std::string scenario = "solar_system";
    int steps = STEP_COUNT;
    double dt = 0.;
    double limit = 0.5;
    double eps = 0.;
    bool dtOverride = false;            // dt/eps given explicitly, scenario defaults ignored
    bool epsOverride = false;
    int asteroids = ASTEROIDS;
    unsigned seed = 42;
    int threads = N_THREADS;            // workers for the direct summation
    bool parallel = false;
    bool rebuild = true;
    bool compare = false;               // report Barnes-Hut error against direct summation
    std::string csvPath;
    std::string gifPath;
    bool verbose = false;
};

// Parses -key=value switches. Throws std::invalid_argument on anything it
// does not understand.
SimulationConfig parse_args(int argc, char** argv);

// Fills universe with the bodies of config.scenario and resolves dt/eps
// defaults into config. Throws std::invalid_argument for unknown scenarios.
void make_scenario(SimulationConfig& config, System& universe);

std::string usage();
