#include "quadtree.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

#ifndef DEBUG
#define DEBUG false
#endif

const char* quadName(Quad quad) {
    switch (quad) {
        case Quad::NW: return "NW";
        case Quad::NE: return "NE";
        case Quad::SW: return "SW";
        case Quad::SE: return "SE";
    }
    return "?";
}

Quad findQuadrant(const Vector& b_pos, const Vector& q_pos) {
    Vector vec = b_pos - q_pos;
    // Body sitting exactly on the center: atan2(0, 0) == 0, so SW
    if (vec.data[0] == 0 && vec.data[1] == 0) {
        return Quad::SW;
    }
    double direc = std::atan2(vec.data[1], vec.data[0]);
    // (-x, -0.0) comes back as -pi, which points the same way as pi
    if (direc == -M_PI) {
        direc = M_PI;
    }
    const double pi2 = M_PI * 0.5;
    if (0 < direc && direc <= pi2) return Quad::NE;
    if (pi2 < direc && direc <= M_PI) return Quad::NW;
    if (-pi2 < direc && direc <= 0) return Quad::SW;
    if (-M_PI < direc && direc <= -pi2) return Quad::SE;

    // Only a NaN angle gets here
    std::ostringstream msg;
    msg << "cannot classify offset (" << vec.data[0] << ", " << vec.data[1]
        << ") from node center (" << q_pos.data[0] << ", " << q_pos.data[1] << ") into a quadrant";
    throw QuadrantError(msg.str());
}


// Node implementations
Node::Node(const Vector& pos, double w, double h, const std::vector<const Body*>& bodies, int depth)
    : pos(pos), w(w), h(h), cm(0., 0.), totalMass(0.), bodyCount(bodies.size()), level(depth) {
    for (const Body* b : bodies) {
        totalMass += b->m;
    }
    createChildNodes(bodies);
}

void Node::calcCm(const std::vector<const Body*>& bodies) {
    if (totalMass <= 0) {
        std::ostringstream msg;
        msg << "node at (" << pos.data[0] << ", " << pos.data[1] << ") holds " << bodies.size()
            << " bodies with total mass " << totalMass;
        throw std::domain_error(msg.str());
    }
    Vector prod(0., 0.);
    for (const Body* b : bodies) {
        prod += b->coordinates * b->m;
    }
    cm = prod / totalMass;
}

void Node::createChildNodes(const std::vector<const Body*>& bodies) {
    // Empty node: zero mass, cm at the origin, nothing to split
    if (bodies.empty()) {
        return;
    }
    // A single body is its own center of mass
    if (bodies.size() == 1) {
        cm = bodies[0]->coordinates;
        return;
    }

    // Bodies on the very same spot would share a quadrant at every level,
    // so they stay together as one aggregate leaf.
    const Vector& first = bodies[0]->coordinates;
    bool coincident = std::all_of(bodies.begin(), bodies.end(),
                                  [&first](const Body* b) { return b->coordinates == first; });
    if (coincident) {
        cm = first;
        return;
    }
    calcCm(bodies);
    if (level >= MAX_TREE_DEPTH) {
        members.reserve(bodies.size());
        for (const Body* b : bodies) {
            members.push_back(Member{b->coordinates, b->m});
        }
        if (DEBUG) {
            std::cout << "Depth limit reached with " << bodies.size() << " bodies near ("
                      << cm.data[0] << ", " << cm.data[1] << ")\n";
        }
        return;
    }

    std::vector<const Body*> b_quads[4];
    for (const Body* b : bodies) {
        Quad quad = findQuadrant(b->coordinates, pos);
        b_quads[static_cast<int>(quad)].push_back(b);
    }
    for (int q = 0; q < 4; ++q) {
        if (!b_quads[q].empty()) {
            createNode(static_cast<Quad>(q), b_quads[q]);
        }
    }
}

void Node::createNode(Quad quad, const std::vector<const Body*>& bodies) {
    double half_w = w / 2;
    double half_h = h / 2;
    double x = pos.data[0];
    double y = pos.data[1];
    switch (quad) {
        case Quad::NW: x -= half_w; y += half_h; break;
        case Quad::NE: x += half_w; y += half_h; break;
        case Quad::SW: x -= half_w; y -= half_h; break;
        case Quad::SE: x += half_w; y -= half_h; break;
    }
    children.push_back(std::make_unique<Node>(Vector(x, y), half_w, half_h, bodies, level + 1));
}

std::size_t Node::countNodes() const {
    std::size_t count = 1;
    for (const auto& child : children) {
        count += child->countNodes();
    }
    return count;
}

int Node::height() const {
    int deepest = 0;
    for (const auto& child : children) {
        deepest = std::max(deepest, 1 + child->height());
    }
    return deepest;
}


TraversalStats& TraversalStats::operator+=(const TraversalStats& other) {
    visited += other.visited;
    accepted += other.accepted;
    descents += other.descents;
    skipped += other.skipped;
    return *this;
}


// QuadTree implementations
QuadTree::QuadTree(std::vector<Body>& bodies, double dt, double limit, double eps, QuadTreeOptions options)
    : dt(dt), limit(limit), eps(eps), options(options), bodies(bodies) {
    if (!(limit > 0)) {
        throw std::invalid_argument("acceptance limit must be positive, got " + std::to_string(limit));
    }
    if (!(eps >= 0)) {
        throw std::invalid_argument("softening eps must be non-negative, got " + std::to_string(eps));
    }
    if (!std::isfinite(dt)) {
        throw std::invalid_argument("time step must be finite");
    }
    for (size_t i = 0; i < bodies.size(); ++i) {
        const Body& b = bodies[i];
        if (!(b.m > 0) || !std::isfinite(b.m)) {
            throw std::invalid_argument("body " + std::to_string(i) + " has non-positive or non-finite mass");
        }
        if (!std::isfinite(b.coordinates.data[0]) || !std::isfinite(b.coordinates.data[1])) {
            throw std::invalid_argument("body " + std::to_string(i) + " has non-finite coordinates");
        }
    }
    build();
}

void QuadTree::build() {
    // Root sits at the origin and reaches the farthest body
    double dist = 0.;
    std::vector<const Body*> ptrs;
    ptrs.reserve(bodies.size());
    for (const auto& b : bodies) {
        ptrs.push_back(&b);
        dist = std::max(dist, vector_len(b.coordinates));
    }
    root_ = std::make_unique<Node>(Vector(0., 0.), dist, dist, ptrs);
    stale_ = false;
    builds_++;
}

// Plummer-softened pull of a point mass sitting vec away
static Vector pointMassPull(const Vector& vec, double dist, double mass, double eps) {
    double angle = std::atan2(vec.data[1], vec.data[0]);
    double denom = std::pow(dist * dist + eps * eps, 1.5);
    double mag = G * mass * dist / denom;
    return Vector(std::cos(angle), std::sin(angle)) * mag;
}

Vector QuadTree::compute_acceleration(const Body& body, TraversalStats* stats) const {
    Vector acc(0., 0.);
    if (!root_ || root_->bodyCount == 0) return acc;

    std::vector<const Node*> stack;
    stack.reserve(64);
    stack.push_back(root_.get());
    while (!stack.empty()) {
        const Node* node = stack.back();
        stack.pop_back();
        if (stats) stats->visited++;

        double size = 0.5 * (node->w + node->h);
        Vector vec = node->cm - body.coordinates;
        double dist = vector_len(vec);
        bool farEnough = dist > 0 && (size / dist) < limit;
        // A depth-capped leaf that is too close: every member pulls on its own
        if (!node->members.empty() && !farEnough) {
            for (const Node::Member& member : node->members) {
                Vector mvec = member.pos - body.coordinates;
                double mdist = vector_len(mvec);
                if (mdist == 0) {
                    if (stats) stats->skipped++;
                    continue;
                }
                acc += pointMassPull(mvec, mdist, member.m, eps);
                if (stats) stats->accepted++;
            }
            continue;
        }
        // The body itself (or anything exactly on top of it) does not pull
        if (dist == 0) {
            if (stats) stats->skipped++;
            continue;
        }
        // Far enough away, or a leaf that is exact anyway: one point mass
        if (farEnough || node->isLeaf()) {
            acc += pointMassPull(vec, dist, node->totalMass, eps);
            if (stats) stats->accepted++;
            continue;
        }
        if (stats) stats->descents++;
        for (const auto& child : node->children) {
            stack.push_back(child.get());
        }
    }
    return acc;
}

void QuadTree::step_forward(int n) {
    if (stale_ && options.rebuildEachStep) {
        build();
    }

    // Every traversal reads the same tree; nobody moves until all are done
    const int count = static_cast<int>(bodies.size());
    std::vector<Vector> accs(count);
    std::vector<TraversalStats> stats(count);
    if (options.parallel) {
        #pragma omp parallel for schedule(static)
        for (int i = 0; i < count; ++i) {
            accs[i] = compute_acceleration(bodies[i], &stats[i]);
        }
    } else {
        for (int i = 0; i < count; ++i) {
            accs[i] = compute_acceleration(bodies[i], &stats[i]);
        }
    }

    stepStats_ = TraversalStats();
    for (int i = 0; i < count; ++i) {
        stepStats_ += stats[i];
        bodies[i].update(accs[i], dt, n);
    }
    stale_ = true;

    if (DEBUG) {
        std::cout << "Frame " << n << ": " << root_->countNodes() << " nodes, "
                  << stepStats_.accepted << " accepted, " << stepStats_.descents << " descents\n";
    }
}
