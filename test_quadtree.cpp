#include "src/quadtree.hpp"
#include "src/simplesimulation.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>
#include <vector>

namespace {

std::vector<Body> randomBodies(int n, unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<> pos(-1e9, 1e9);
    std::uniform_real_distribution<> mass(1e20, 1e24);
    std::uniform_real_distribution<> vel(-1e3, 1e3);
    std::vector<Body> bodies;
    for (int i = 0; i < n; ++i) {
        bodies.push_back(Body(mass(gen), Vector(pos(gen), pos(gen)), Vector(vel(gen), vel(gen))));
    }
    return bodies;
}

// Two equal masses at (-d, 0) and (d, 0)
std::vector<Body> symmetricPair(double m, double d) {
    return {Body(m, Vector(-d, 0), Vector(0, 0)), Body(m, Vector(d, 0), Vector(0, 0))};
}

}

TEST(QuadTree, RootSpansTheFarthestBody) {
    std::vector<Body> bodies = {
        Body(1, Vector(3, 4), Vector()),
        Body(1, Vector(-1, 0), Vector()),
    };
    QuadTree tree(bodies, 1.0);
    ASSERT_NE(tree.root(), nullptr);
    EXPECT_EQ(tree.root()->pos, Vector(0, 0));
    EXPECT_DOUBLE_EQ(tree.root()->w, 5.);
    EXPECT_DOUBLE_EQ(tree.root()->h, 5.);
    EXPECT_DOUBLE_EQ(tree.root()->totalMass, 2.);
    EXPECT_EQ(tree.buildCount(), 1u);
}

TEST(QuadTree, DefaultParameters) {
    std::vector<Body> bodies = symmetricPair(1e20, 1e4);
    QuadTree tree(bodies, 2.0);
    EXPECT_DOUBLE_EQ(tree.dt, 2.0);
    EXPECT_DOUBLE_EQ(tree.limit, 5.);
    EXPECT_DOUBLE_EQ(tree.eps, 1e3);
    EXPECT_TRUE(tree.options.rebuildEachStep);
    EXPECT_FALSE(tree.options.parallel);
}

TEST(QuadTree, RejectsBadParameters) {
    std::vector<Body> bodies = symmetricPair(1e20, 1e4);
    EXPECT_THROW(QuadTree(bodies, 1.0, 0.0), std::invalid_argument);
    EXPECT_THROW(QuadTree(bodies, 1.0, -1.0), std::invalid_argument);
    EXPECT_THROW(QuadTree(bodies, 1.0, 5, -1.0), std::invalid_argument);
    EXPECT_THROW(QuadTree(bodies, std::numeric_limits<double>::infinity()), std::invalid_argument);

    std::vector<Body> massless = {Body(0, Vector(1, 1), Vector())};
    EXPECT_THROW(QuadTree(massless, 1.0), std::invalid_argument);

    std::vector<Body> lost = {Body(1, Vector(std::nan(""), 1), Vector())};
    EXPECT_THROW(QuadTree(lost, 1.0), std::invalid_argument);
}

TEST(QuadTree, EmptySystemIsANoOp) {
    std::vector<Body> bodies;
    QuadTree tree(bodies, 1.0);
    EXPECT_EQ(tree.root()->bodyCount, 0u);
    EXPECT_NO_THROW(tree.step_forward(0));
    EXPECT_NO_THROW(tree.step_forward(1));
}

TEST(QuadTree, LonelyBodyFeelsNothing) {
    std::vector<Body> bodies = {Body(1e24, Vector(7, 3), Vector(2, -1))};
    QuadTree tree(bodies, 10.0);
    tree.step_forward(0);

    EXPECT_EQ(bodies[0].acceleration, Vector(0, 0));
    EXPECT_EQ(bodies[0].velocity, Vector(2, -1));
    EXPECT_DOUBLE_EQ(bodies[0].coordinates[0], 27.);
    EXPECT_DOUBLE_EQ(bodies[0].coordinates[1], -7.);
    EXPECT_EQ(tree.lastStepStats().skipped, 1u);
    EXPECT_EQ(tree.lastStepStats().accepted, 0u);
}

TEST(QuadTree, TwoBodiesMatchTheSoftenedClosedForm) {
    const double m = 1e20, d = 5e3, eps = 1e3;
    std::vector<Body> bodies = symmetricPair(m, d);
    // Root is opened (size / dist == 1), the partner leaf is summed exactly
    QuadTree tree(bodies, 1.0, 0.5, eps);

    double expected = G * m * (2 * d) / std::pow((2 * d) * (2 * d) + eps * eps, 1.5);
    TraversalStats stats;
    Vector a = tree.compute_acceleration(bodies[0], &stats);
    Vector b = tree.compute_acceleration(bodies[1]);

    EXPECT_NEAR(a[0], expected, 1e-12 * expected);
    EXPECT_NEAR(a[1], 0., 1e-12 * expected);
    EXPECT_NEAR(b[0], -expected, 1e-12 * expected);
    EXPECT_NEAR(b[1], 0., 1e-12 * expected);
    EXPECT_EQ(stats.descents, 1u);
    EXPECT_EQ(stats.skipped, 1u);
    EXPECT_EQ(stats.accepted, 1u);
}

TEST(QuadTree, LargeLimitTakesTheRootAsOnePointMass) {
    const double m = 1e20, d = 5e3, eps = 1e3;
    std::vector<Body> bodies = symmetricPair(m, d);
    QuadTree tree(bodies, 1.0, 10.0, eps);

    // Both masses sit at the origin, d away from either body
    double expected = G * (2 * m) * d / std::pow(d * d + eps * eps, 1.5);
    TraversalStats stats;
    Vector a = tree.compute_acceleration(bodies[0], &stats);
    EXPECT_NEAR(a[0], expected, 1e-12 * expected);
    EXPECT_NEAR(a[1], 0., 1e-12 * expected);
    EXPECT_EQ(stats.visited, 1u);
    EXPECT_EQ(stats.accepted, 1u);
    EXPECT_EQ(stats.descents, 0u);
}

TEST(QuadTree, OpeningEverythingReproducesDirectSummation) {
    std::vector<Body> bodies = randomBodies(150, 3);
    const double eps = 1e3;
    QuadTree tree(bodies, 1.0, 1e-300, eps);
    for (size_t i = 0; i < bodies.size(); ++i) {
        TraversalStats stats;
        Vector approx = tree.compute_acceleration(bodies[i], &stats);
        Vector exact = direct_acceleration(bodies, i, eps);
        EXPECT_NEAR(approx[0], exact[0], 1e-9 * vector_len(exact));
        EXPECT_NEAR(approx[1], exact[1], 1e-9 * vector_len(exact));
        // Only the body's own leaf is skipped
        EXPECT_EQ(stats.skipped, 1u);
        EXPECT_EQ(stats.accepted, bodies.size() - 1);
    }
}

TEST(QuadTree, DepthCappedLeafDoesNotPullOnItsOwnMembers) {
    std::vector<Body> bodies = {
        Body(1, Vector(-2e-39, 1e-39), Vector()),
        Body(1, Vector(-2e-39, 1.0001e-39), Vector()),
        Body(1, Vector(1, 0), Vector()),
    };
    QuadTree tree(bodies, 1.0, 1e-300, 0.);
    ASSERT_EQ(tree.root()->height(), MAX_TREE_DEPTH);
    for (size_t i = 0; i < bodies.size(); ++i) {
        TraversalStats stats;
        Vector approx = tree.compute_acceleration(bodies[i], &stats);
        Vector exact = direct_acceleration(bodies, i, 0.);
        EXPECT_NEAR(approx[0], exact[0], 1e-9 * vector_len(exact)) << "body " << i;
        EXPECT_NEAR(approx[1], exact[1], 1e-9 * vector_len(exact)) << "body " << i;
        EXPECT_EQ(stats.skipped, 1u) << "body " << i;
        EXPECT_EQ(stats.accepted, bodies.size() - 1) << "body " << i;
    }
}

TEST(QuadTree, SmallerLimitNeverDescendsLess) {
    std::vector<Body> bodies = randomBodies(200, 11);
    const double limits[] = {5.0, 2.0, 1.0, 0.6, 0.3, 0.1, 0.01};
    for (size_t i = 0; i < bodies.size(); ++i) {
        size_t previous = 0;
        for (double limit : limits) {
            QuadTree tree(bodies, 1.0, limit);
            TraversalStats stats;
            tree.compute_acceleration(bodies[i], &stats);
            EXPECT_GE(stats.descents, previous) << "body " << i << " limit " << limit;
            previous = stats.descents;
        }
    }
}

TEST(QuadTree, CoincidentBodiesDoNotPullEachOther) {
    std::vector<Body> bodies = {
        Body(1e22, Vector(1e6, 1e6), Vector()),
        Body(1e22, Vector(1e6, 1e6), Vector()),
    };
    QuadTree tree(bodies, 1.0);
    EXPECT_TRUE(tree.root()->isLeaf());
    Vector a = tree.compute_acceleration(bodies[0]);
    EXPECT_EQ(a, Vector(0, 0));
}

TEST(QuadTree, StepUpdatesAllBodiesFromTheSameTree) {
    std::vector<Body> bodies = symmetricPair(1e18, 1e5);
    QuadTree tree(bodies, 60.0, 0.5);
    for (int n = 0; n < 5; ++n) {
        tree.step_forward(n);
        EXPECT_NEAR(bodies[0].coordinates[0], -bodies[1].coordinates[0], 1e-9);
        EXPECT_NEAR(bodies[0].velocity[0], -bodies[1].velocity[0], 1e-12);
    }
    // They fall toward each other
    EXPECT_GT(bodies[0].velocity[0], 0.);
    EXPECT_GT(bodies[0].coordinates[0], -1e5);
}

TEST(QuadTree, TreeIsRebuiltBeforeEveryLaterStep) {
    std::vector<Body> bodies = randomBodies(50, 5);
    QuadTree tree(bodies, 3600.0, 0.5);
    Vector initialCm = tree.root()->cm;
    tree.step_forward(0);
    EXPECT_EQ(tree.buildCount(), 1u);
    tree.step_forward(1);
    tree.step_forward(2);
    EXPECT_EQ(tree.buildCount(), 3u);
    EXPECT_NE(tree.root()->cm, initialCm);
}

TEST(QuadTree, StaleTreeKeepsTheFirstPartition) {
    std::vector<Body> bodies = randomBodies(50, 5);
    QuadTreeOptions options;
    options.rebuildEachStep = false;
    QuadTree tree(bodies, 3600.0, 0.5, 1e3, options);
    Vector initialCm = tree.root()->cm;
    for (int n = 0; n < 3; ++n) tree.step_forward(n);
    EXPECT_EQ(tree.buildCount(), 1u);
    EXPECT_EQ(tree.root()->cm, initialCm);

    tree.build();
    EXPECT_EQ(tree.buildCount(), 2u);
    EXPECT_NE(tree.root()->cm, initialCm);
}

TEST(QuadTree, ParallelStepMatchesSequentialStep) {
    std::vector<Body> sequential = randomBodies(300, 9);
    std::vector<Body> parallel = sequential;
    QuadTreeOptions options;
    options.parallel = true;

    QuadTree seqTree(sequential, 3600.0, 0.5);
    QuadTree parTree(parallel, 3600.0, 0.5, 1e3, options);
    for (int n = 0; n < 3; ++n) {
        seqTree.step_forward(n);
        parTree.step_forward(n);
    }
    for (size_t i = 0; i < sequential.size(); ++i) {
        EXPECT_EQ(sequential[i].coordinates, parallel[i].coordinates) << "body " << i;
        EXPECT_EQ(sequential[i].velocity, parallel[i].velocity) << "body " << i;
    }
    EXPECT_EQ(seqTree.lastStepStats().visited, parTree.lastStepStats().visited);
}
