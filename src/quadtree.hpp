#pragma once

#include "core.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Past this depth a node stops splitting and keeps its bodies as one aggregate leaf.
#define MAX_TREE_DEPTH 128

// The four sub-quadrants of a node
enum class Quad { NW, NE, SW, SE };

const char* quadName(Quad quad);

// Raised when a body cannot be placed in any quadrant (non-finite offset).
class QuadrantError : public std::domain_error {
    public:
        explicit QuadrantError(const std::string& what) : std::domain_error(what) {}
};

// Angular quadrant of b_pos around q_pos:
//   (0, pi/2] NE, (pi/2, pi] NW, (-pi/2, 0] SW, (-pi, -pi/2] SE.
// A zero offset lands in SW (atan2(0, 0) == 0); an angle of exactly -pi is
// the same direction as pi and lands in NW.
Quad findQuadrant(const Vector& b_pos, const Vector& q_pos);

// A quadrant of space. pos is the middle point, w and h the half-extents
// used to place and size the children.
class Node {
    public:
        Node(const Vector& pos, double w, double h, const std::vector<const Body*>& bodies, int depth = 0);

        Node(const Node&) = delete;
        Node& operator=(const Node&) = delete;

        Vector pos;
        double w, h;
        Vector cm;
        double totalMass;
        std::size_t bodyCount;
        int level;
        std::vector<std::unique_ptr<Node>> children; // NW, NE, SW, SE order, empty quadrants skipped

        // Bodies of a leaf cut off by MAX_TREE_DEPTH, kept so they can be summed one by one
        struct Member {
            Vector pos;
            double m;
        };
        std::vector<Member> members;

        bool isLeaf() const { return children.empty(); }
        std::size_t countNodes() const;
        int height() const;

    private:
        void createChildNodes(const std::vector<const Body*>& bodies);
        void createNode(Quad quad, const std::vector<const Body*>& bodies);
        void calcCm(const std::vector<const Body*>& bodies);
};

struct TraversalStats {
    std::size_t visited = 0;   // nodes popped off the stack
    std::size_t accepted = 0;  // nodes summed as a point mass
    std::size_t descents = 0;  // internal nodes opened
    std::size_t skipped = 0;   // nodes sitting exactly on the body

    TraversalStats& operator+=(const TraversalStats& other);
};

struct QuadTreeOptions {
    bool rebuildEachStep = true; // false keeps the tree from the first build forever
    bool parallel = false;       // OpenMP over the per-body loop
};

class QuadTree {
    public:
        QuadTree(std::vector<Body>& bodies, double dt, double limit = 5, double eps = 1e3,
                 QuadTreeOptions options = QuadTreeOptions());

        // Advance every body by one frame. n is the frame index passed to Body::update.
        void step_forward(int n);

        // Rebuild the tree from the current body positions.
        void build();

        Vector compute_acceleration(const Body& body, TraversalStats* stats = nullptr) const;

        const Node* root() const { return root_.get(); }
        const TraversalStats& lastStepStats() const { return stepStats_; }
        std::size_t buildCount() const { return builds_; }

        double dt, limit, eps;
        QuadTreeOptions options;

    private:
        std::vector<Body>& bodies;
        std::unique_ptr<Node> root_;
        bool stale_ = false;
        std::size_t builds_ = 0;
        TraversalStats stepStats_;
};
