#include "core.hpp"
#include <Magick++.h>

#include <cmath>
#include <fstream>
#include <string>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <algorithm>
using std::string;
using namespace Magick;

// Vector implementations
Vector::Vector(double x, double y) {
    data[0] = x;
    data[1] = y;
}

Vector Vector::operator+(const Vector& other) const {
    return Vector(data[0] + other.data[0], data[1] + other.data[1]);
}

Vector Vector::operator-(const Vector& other) const {
    return Vector(data[0] - other.data[0], data[1] - other.data[1]);
}

Vector Vector::operator*(double scalar) const {
    return Vector(data[0] * scalar, data[1] * scalar);
}

Vector Vector::operator/(double scalar) const {
    return Vector(data[0]/scalar, data[1]/scalar);
}

void Vector::operator+=(const Vector& other) {
    data[0] += other.data[0];
    data[1] += other.data[1];
}

void Vector::operator-=(const Vector& other) {
    data[0] -= other.data[0];
    data[1] -= other.data[1];
}

bool Vector::operator==(const Vector& other) const {
    return data[0] == other.data[0] && data[1] == other.data[1];
}

double Vector::norm() const {
    return std::sqrt(data[0]*data[0] + data[1]*data[1]);
}

double vector_len(const Vector& v) {
    return v.norm();
}


// Body implementations
Body::Body() : m(0), coordinates(), velocity(), acceleration(), color(""), size(0), title("") {}

Body::Body(double mass, const Vector& pos, const Vector& vel, string color, int size, string title)
    : m(mass), coordinates(pos), velocity(vel), acceleration(), color(color), size(size), title(title) {}

void Body::update(const Vector& acc, double dt, int n) {
    acceleration = acc;

    // Kick: the very first frame only moves the velocity half a step
    double kick = (n == 0) ? 0.5 * dt : dt;
    velocity.data[0] += acc.data[0] * kick;
    velocity.data[1] += acc.data[1] * kick;

    // Drift
    coordinates.data[0] += velocity.data[0] * dt;
    coordinates.data[1] += velocity.data[1] * dt;
}


// System implementations
void System::add(Body body) {
    bodies.push_back(body);
}

void System::record_frame() {
    std::vector<Vector> frame;
    frame.reserve(bodies.size());
    for (const auto& body : bodies) {
        frame.push_back(body.coordinates);
    }
    telemetry.push_back(frame);
}

bool System::export_csv(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open " << path << " for writing\n";
        return false;
    }

    // CSV header
    file << "time";
    for (size_t j = 0; j < bodies.size(); j++) {
        string name = bodies[j].title.empty() ? "body" + std::to_string(j) : bodies[j].title;
        file << "," << name << "_x," << name << "_y";
    }
    file << "\n";

    for (size_t i = 0; i < telemetry.size(); i++) {
        file << std::scientific << std::setprecision(6)  // Use scientific notation for large numbers
            << i * dt;
        for (const auto& pos : telemetry[i]) {
            file << "," << pos.data[0] << "," << pos.data[1];
        }
        file << "\n";
    }
    return static_cast<bool>(file);
}

// Utility function implementations
double sqr(double x) {
    return x * x;
}


std::pair<Vector, Vector> System::getBounds() const {
    if (telemetry.empty()) return {Vector(0,0), Vector(1,1)};

    Vector min_pos(INFINITY, INFINITY);
    Vector max_pos(-INFINITY, -INFINITY);

    for (const auto& frame : telemetry) {
        for (const auto& pos : frame) {
            min_pos.data[0] = std::min(min_pos.data[0], pos.data[0]);
            min_pos.data[1] = std::min(min_pos.data[1], pos.data[1]);
            max_pos.data[0] = std::max(max_pos.data[0], pos.data[0]);
            max_pos.data[1] = std::max(max_pos.data[1], pos.data[1]);
        }
    }
    if (min_pos.data[0] > max_pos.data[0]) return {Vector(0,0), Vector(1,1)}; // frames without bodies

    // Add 10% padding
    Vector padding = (max_pos - min_pos) * 0.1;
    return {min_pos - padding, max_pos + padding};
}

std::pair<int, int> System::worldToScreen(const Vector& pos, const Vector& min, const Vector& max,
                                          int width, int height, int padding) const {
    double spanX = max.data[0] - min.data[0];
    double spanY = max.data[1] - min.data[1];
    // A single motionless body collapses the box to a point
    if (spanX == 0) spanX = 1;
    if (spanY == 0) spanY = 1;
    int x = static_cast<int>((pos.data[0] - min.data[0]) / spanX * (width - 2*padding) + padding);
    int y = static_cast<int>(height - ((pos.data[1] - min.data[1]) / spanY * (height - 2*padding) + padding));
    return {x, y};
}


void System::visualize(const std::string& name, bool time, bool axes, size_t frame_stride) {
    InitializeMagick(nullptr);
    const int width = 600;
    const int height = 600;
    const int padding = 25;
    if (frame_stride == 0) frame_stride = 1;
    std::vector<Image> frames;

    auto bounds = getBounds();
    Vector min_pos = bounds.first;
    Vector max_pos = bounds.second;

    for (size_t i = 0; i < telemetry.size(); i += frame_stride) {
        // Progress, mainly for debug purposes
        std::cout << "Rendering frame " << i / frame_stride << "\r" << std::flush;

        Image image(Geometry(width, height), Color("black"));
        if (axes) {
            image.strokeColor("gray");
            image.draw(DrawableLine(padding, height-padding, width-padding, height-padding)); // X axis
            image.draw(DrawableLine(padding, height-padding, padding, padding)); // Y axis
        }
        for (size_t body_idx = 0; body_idx < telemetry[i].size(); body_idx++) {
            const Body& body = bodies[body_idx];
            auto screen = worldToScreen(telemetry[i][body_idx], min_pos, max_pos, width, height, padding);
            int x = screen.first;
            int y = screen.second;

            image.fillColor(Color(body.color.empty() ? "white" : body.color));
            int radius = std::max(body.size, 1);
            image.draw(DrawableCircle(x, y, x + radius, y + radius));

            if (!body.title.empty()) {
                image.fillColor("white");
                image.draw(DrawableText(x + 10, y - 10, body.title));
            }
        }

        if (time) {
            double current_time = i * dt;
            std::string timeInfo = "Time: " + std::to_string(current_time) + "s";
            image.fillColor("white");
            image.draw(DrawableText(padding, padding, timeInfo));
        }
        image.animationDelay(5);
        frames.push_back(std::move(image));
    }
    std::cout << "\nImages generated. Now writing to file...\n";

    auto start = std::chrono::high_resolution_clock::now();
    writeImages(frames.begin(), frames.end(), name);
    auto end = std::chrono::high_resolution_clock::now();
    auto time_taken = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    std::cout << "Image Writing time: " << time_taken.count() << " milliseconds.\n";
    frames.clear();
    std::cout << "File written.\n";
}
