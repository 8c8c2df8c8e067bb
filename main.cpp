#include "src/core.hpp"
#include "src/config.hpp"
#include "src/simplesimulation.hpp"
#include "src/barneshutt.hpp"

#ifndef VISUALIZE
#define VISUALIZE false
#endif

#ifndef PRINT_TELEMETRY
#define PRINT_TELEMETRY false
#endif

#ifndef FRAME_NUM
#define FRAME_NUM 100
#endif

#include <Magick++.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <string>

static int run(SimulationConfig& config) {
    System universe;
    make_scenario(config, universe);

    std::cout << "Starting the simulation: " << universe.bodies.size() << " bodies, "
              << config.steps << " steps of " << config.dt << "s (" << config.scenario << ")\n";

    if (config.compare) {
        auto start_cmp = std::chrono::high_resolution_clock::now();
        AccelerationError err = acceleration_error(universe.bodies, config.limit, config.eps, config.threads);
        auto end_cmp = std::chrono::high_resolution_clock::now();
        auto time_cmp = std::chrono::duration_cast<std::chrono::milliseconds>(end_cmp - start_cmp);
        std::cout << "Barnes-Hut error at limit " << config.limit << ": max " << err.maxRelative
                  << ", mean " << err.meanRelative << " over " << err.compared << " bodies ("
                  << time_cmp.count() << " milliseconds).\n";
    }

    auto start = std::chrono::high_resolution_clock::now();
    if (config.method == "naive") {
        naive_simulation(universe, config.steps, config.eps, config.threads);
    } else {
        QuadTreeOptions options;
        options.parallel = config.parallel;
        options.rebuildEachStep = config.rebuild;
        barnes_hut_simulation(universe, config.steps, config.limit, config.eps, options);
    }
    auto end = std::chrono::high_resolution_clock::now();
    auto time_taken = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    std::cout << "Simulation time (" << config.method << "): " << time_taken.count() << " milliseconds.\n";

    if (PRINT_TELEMETRY || config.verbose) {
        for (size_t i = 0; i < universe.telemetry.size(); i += 1) {
            std::cout << "Frame: " << i << ", Time: " << i*universe.dt << "s\n";
            for (size_t j = 0; j < universe.telemetry[i].size(); j++) {
                const Vector& pos = universe.telemetry[i][j];
                std::cout << "  Position " << universe.bodies[j].title << ": ("
                        << pos.data[0] << ", " << pos.data[1] << ")\n";
            }
        }
    }

    if (!config.csvPath.empty()) {
        if (!universe.export_csv(config.csvPath)) {
            return 1;
        }
        std::cout << "Telemetry written to " << config.csvPath << "\n";
    }

    std::cout << "Simulations done.\n";

    std::string gif = config.gifPath;
    if (gif.empty() && VISUALIZE) {
        gif = "nbody_simulation.gif";
    }
    if (!gif.empty()) {
        std::cout << "Generating the visualizations...\n";
        size_t stride = std::max<size_t>(1, universe.telemetry.size() / FRAME_NUM);
        auto start2 = std::chrono::high_resolution_clock::now();
        universe.visualize(gif, true, false, stride);
        auto end2 = std::chrono::high_resolution_clock::now();
        auto time_taken2 = std::chrono::duration_cast<std::chrono::milliseconds>(end2 - start2);
        std::cout << "Visualization time: " << time_taken2.count() << " milliseconds.\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    Magick::InitializeMagick(*argv);

    SimulationConfig config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << usage();
        return 1;
    }

    try {
        return run(config);
    } catch (const Magick::Exception& e) {
        std::cerr << "Error: visualization failed: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return 1;
}
