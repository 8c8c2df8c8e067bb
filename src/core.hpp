#ifndef CORE_H
#define CORE_H

#include <vector>
#include <string>
#include <utility>
using std::string;

#ifndef STEP_COUNT
#define STEP_COUNT 500
#endif

constexpr double G = 6.67430e-11;

// Vector class
class Vector {
    public:
        explicit Vector(double x = 0, double y = 0);
        double data[2];

        Vector operator+(const Vector& other) const;
        Vector operator-(const Vector& other) const;
        Vector operator*(double scalar) const;
        Vector operator/(double scalar) const;
        void operator+=(const Vector& other);
        void operator-=(const Vector& other);
        bool operator==(const Vector& other) const;
        bool operator!=(const Vector& other) const { return !(*this == other); }
        double& operator[](int i) { return data[i]; }
        const double& operator[](int i) const { return data[i]; }

        double norm() const;
};

// Euclidean length of a 2-D vector
double vector_len(const Vector& v);

// Body class
class Body {
    public:
        double m;
        Vector coordinates;
        Vector velocity;
        Vector acceleration; // last acceleration handed to update()

        // Aesthetic, for the visualizations
        string color;
        int size;
        string title;

        Body();
        Body(double mass, const Vector& pos, const Vector& vel, string color = "white", int size = 1, string title = "");

        // Leapfrog step. Frame 0 kicks the velocity by half a step so that
        // velocities stay staggered half a step ahead of positions.
        void update(const Vector& acc, double dt, int n);
};

// System class
class System {
    public:
        std::vector<Body> bodies;
        std::vector<std::vector<Vector>> telemetry;
        double dt = 0.;

        void add(Body body);
        void record_frame();
        bool export_csv(const std::string& path) const;
        void visualize(const std::string& name, bool time = true, bool axes = true, size_t frame_stride = 1);

        std::pair<Vector, Vector> getBounds() const;
    private:
        std::pair<int, int> worldToScreen(const Vector& pos, const Vector& min, const Vector& max, int width, int height, int padding) const;
};

// Utility functions
double sqr(double x);

#endif
