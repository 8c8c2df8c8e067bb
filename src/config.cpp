#include "config.hpp"

#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323
#endif

namespace {

double parse_double(const std::string& key, const std::string& value) {
    size_t used = 0;
    double result = 0.;
    try {
        result = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad number for -" + key + ": '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument("bad number for -" + key + ": '" + value + "'");
    }
    return result;
}

long parse_long(const std::string& key, const std::string& value) {
    size_t used = 0;
    long result = 0;
    try {
        result = std::stol(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad integer for -" + key + ": '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument("bad integer for -" + key + ": '" + value + "'");
    }
    return result;
}

int parse_count(const std::string& key, const std::string& value, int minimum) {
    long result = parse_long(key, value);
    if (result < minimum || result > 100000000L) {
        throw std::invalid_argument("-" + key + " out of range: " + value);
    }
    return static_cast<int>(result);
}

}

std::string usage() {
    return "usage: bhquad [-method=barneshut|naive] [-scenario=solar_system|two_body|cluster]\n"
           "              [-steps=N] [-dt=S] [-limit=L] [-eps=E] [-asteroids=N] [-seed=N]\n"
           "              [-threads=N] [-csv=FILE] [-gif=FILE] [-parallel] [-stale-tree]\n"
           "              [-compare] [-verbose]\n";
}

SimulationConfig parse_args(int argc, char** argv) {
    SimulationConfig config;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-parallel") { config.parallel = true; continue; }
        if (arg == "-stale-tree") { config.rebuild = false; continue; }
        if (arg == "-compare") { config.compare = true; continue; }
        if (arg == "-verbose") { config.verbose = true; continue; }

        size_t eq = arg.find('=');
        if (arg.size() < 2 || arg[0] != '-' || eq == std::string::npos) {
            throw std::invalid_argument("unknown argument '" + arg + "'");
        }
        const std::string key = arg.substr(1, eq - 1);
        const std::string value = arg.substr(eq + 1);

        if (key == "method") {
            if (value != "barneshut" && value != "naive") {
                throw std::invalid_argument("unknown method '" + value + "'");
            }
            config.method = value;
        } else if (key == "scenario") {
            config.scenario = value;
        } else if (key == "steps") {
            config.steps = parse_count(key, value, 0);
        } else if (key == "dt") {
            config.dt = parse_double(key, value);
            config.dtOverride = true;
        } else if (key == "limit") {
            config.limit = parse_double(key, value);
        } else if (key == "eps") {
            config.eps = parse_double(key, value);
            config.epsOverride = true;
        } else if (key == "asteroids") {
            config.asteroids = parse_count(key, value, 0);
        } else if (key == "seed") {
            config.seed = static_cast<unsigned>(parse_long(key, value));
        } else if (key == "threads") {
            config.threads = parse_count(key, value, 1);
        } else if (key == "csv") {
            config.csvPath = value;
        } else if (key == "gif") {
            config.gifPath = value;
        } else {
            throw std::invalid_argument("unknown argument '" + arg + "'");
        }
    }
    return config;
}

static void solar_system(const SimulationConfig& config, System& universe) {
    // Sun at the origin, nearly stationary
    universe.add(Body(1.989e30, Vector(0, 0), Vector(0, 0), "orange", 10, "Sun"));
    universe.add(Body(3.285e23, Vector(57.9e9, 0), Vector(0, 47360), "gray", 2, "Mercury"));
    universe.add(Body(4.867e24, Vector(108.2e9, 0), Vector(0, 35020), "yellow", 3, "Venus"));
    universe.add(Body(5.972e24, Vector(149.6e9, 0), Vector(0, 29780), "blue", 3, "Earth"));
    universe.add(Body(6.39e23, Vector(227.9e9, 0), Vector(0, 24077), "red", 4, "Mars"));

    // Asteroid belt on circular orbits around the Sun
    std::mt19937 gen(config.seed);
    const double AU = 149.6e9;
    const double MIN_DIST = 2.2 * AU;
    const double MAX_DIST = 3.2 * AU;
    std::uniform_real_distribution<> mass_dist(1e13, 1e17);
    std::uniform_real_distribution<> dist_dist(MIN_DIST, MAX_DIST);
    std::uniform_real_distribution<> angle_dist(0, 2 * M_PI);

    for (int i = 0; i < config.asteroids; i++) {
        double mass = mass_dist(gen);
        double distance = dist_dist(gen);
        double angle = angle_dist(gen);
        Vector position(distance * cos(angle), distance * sin(angle));
        double velocity_magnitude = sqrt((G * 1.989e30) / distance);
        Vector velocity(-velocity_magnitude * sin(angle), velocity_magnitude * cos(angle));
        universe.add(Body(mass, position, velocity, "green", 1, ""));
    }
}

static void two_body(System& universe) {
    // Equal masses on a shared circular orbit around the origin
    const double m = 5.972e24;
    const double d = 1.0e8;
    double v = sqrt(G * m / (4 * d));
    universe.add(Body(m, Vector(-d, 0), Vector(0, -v), "blue", 4, "A"));
    universe.add(Body(m, Vector(d, 0), Vector(0, v), "red", 4, "B"));
}

static void cluster(const SimulationConfig& config, System& universe) {
    // Uniform disk with a slow solid-body rotation
    std::mt19937 gen(config.seed);
    const double R = 1.0e11;
    std::uniform_real_distribution<> mass_dist(1e22, 1e25);
    std::uniform_real_distribution<> radius_dist(0, 1);
    std::uniform_real_distribution<> angle_dist(0, 2 * M_PI);
    const double omega = 1e-8;

    for (int i = 0; i < config.asteroids; i++) {
        double r = R * sqrt(radius_dist(gen));
        double angle = angle_dist(gen);
        Vector position(r * cos(angle), r * sin(angle));
        Vector velocity(-omega * position.data[1], omega * position.data[0]);
        universe.add(Body(mass_dist(gen), position, velocity, "white", 1, ""));
    }
}

void make_scenario(SimulationConfig& config, System& universe) {
    double dt = 0.;
    double eps = 0.;
    if (config.scenario == "solar_system") {
        solar_system(config, universe);
        dt = 3600;  // Not suggested to take a timestep larger than three hours
        eps = 1e3;
    } else if (config.scenario == "two_body") {
        two_body(universe);
        dt = 60;
        eps = 1e3;
    } else if (config.scenario == "cluster") {
        cluster(config, universe);
        dt = 86400;
        eps = 1e8;
    } else {
        throw std::invalid_argument("unknown scenario '" + config.scenario + "'");
    }
    if (!config.dtOverride) config.dt = dt;
    if (!config.epsOverride) config.eps = eps;
    universe.dt = config.dt;
}
