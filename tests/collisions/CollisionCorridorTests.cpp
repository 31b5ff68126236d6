/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

/**
 * @file CollisionCorridorTests.cpp
 * @brief Tests for the river bank collision corridor
 *
 * Covers window quantization, per-segment caching as the observer moves,
 * bank edge geometry, recovery from a locked physics world and debug lines.
 */

#define BOOST_TEST_MODULE CollisionCorridorTests
#include <boost/test/unit_test.hpp>

#include "collisions/CollisionCorridor.hpp"
#include "mocks/MockPhysicsWorld.hpp"
#include "mocks/MockRenderer.hpp"
#include "mocks/MockTerrain.hpp"
#include <cmath>
#include <stdexcept>
#include <tuple>

using namespace RiverForge;

struct CorridorFixture {
    CorridorFixture() : river(40.0), corridor(physics, river, CollisionConfig{}, &renderer) {}

    MockPhysicsWorld physics;
    MockRenderer renderer;
    StraightRiver river;
    CollisionCorridor corridor;
};

BOOST_AUTO_TEST_SUITE(CollisionConfigTests)

BOOST_AUTO_TEST_CASE(RejectsNonPositiveConfig) {
    MockPhysicsWorld physics;
    StraightRiver river;
    BOOST_CHECK_THROW(CollisionCorridor(physics, river, CollisionConfig{0.0, 5.0, 50.0}),
                      std::invalid_argument);
    BOOST_CHECK_THROW(CollisionCorridor(physics, river, CollisionConfig{300.0, -1.0, 50.0}),
                      std::invalid_argument);
    BOOST_CHECK_THROW(CollisionCorridor(physics, river, CollisionConfig{300.0, 5.0, 0.0}),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(WindowSnapsToUpdateStep) {
    MockPhysicsWorld physics;
    StraightRiver river;
    CollisionCorridor corridor(physics, river);

    auto [start, end] = corridor.computeWindow(1000.0);
    BOOST_CHECK_EQUAL(start, 700.0);
    BOOST_CHECK_EQUAL(end, 1300.0);

    std::tie(start, end) = corridor.computeWindow(1023.0);
    BOOST_CHECK_EQUAL(start, 700.0);
    BOOST_CHECK_EQUAL(end, 1350.0);

    std::tie(start, end) = corridor.computeWindow(-10.0);
    BOOST_CHECK_EQUAL(start, -350.0);
    BOOST_CHECK_EQUAL(end, 300.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CorridorSegmentTests, CorridorFixture)

BOOST_AUTO_TEST_CASE(BuildsOnePairPerStep) {
    corridor.update(1000.0);

    BOOST_CHECK_EQUAL(corridor.getSegmentCount(), 120u);
    BOOST_CHECK_EQUAL(physics.bodyCount(), 240u);
    BOOST_REQUIRE(corridor.getWindowStart().has_value());
    BOOST_CHECK_EQUAL(*corridor.getWindowStart(), 700.0);
    BOOST_CHECK_EQUAL(*corridor.getWindowEnd(), 1300.0);
    BOOST_CHECK_EQUAL(corridor.getSegments().begin()->first, 700.0);
    BOOST_CHECK_EQUAL(corridor.getSegments().rbegin()->first, 1295.0);
}

BOOST_AUTO_TEST_CASE(BankEdgesAreParallelAndOneWidthApart) {
    corridor.update(1000.0);

    for (const auto& [key, segment] : corridor.getSegments()) {
        BOOST_CHECK_EQUAL(segment.zStart, key);
        BOOST_CHECK_EQUAL(segment.zEnd, key + 5.0);

        const auto& left = physics.edgesOf(segment.leftBody);
        const auto& right = physics.edgesOf(segment.rightBody);
        BOOST_REQUIRE_EQUAL(left.size(), 1u);
        BOOST_REQUIRE_EQUAL(right.size(), 1u);

        BOOST_CHECK_EQUAL(left[0].v1.getX(), -20.0);
        BOOST_CHECK_EQUAL(left[0].v2.getX(), -20.0);
        BOOST_CHECK_EQUAL(right[0].v1.getX(), 20.0);
        BOOST_CHECK_EQUAL(right[0].v1.getX() - left[0].v1.getX(), 40.0);
        BOOST_CHECK_EQUAL(left[0].v1.getY(), segment.zStart);
        BOOST_CHECK_EQUAL(left[0].v2.getY(), segment.zEnd);
    }
}

BOOST_AUTO_TEST_CASE(EdgesCarryGhostVertices) {
    corridor.update(1000.0);
    const CollisionSegment& segment = corridor.getSegments().at(800.0);
    const EdgeShape& edge = physics.edgesOf(segment.leftBody).front();

    BOOST_REQUIRE(edge.prev.has_value());
    BOOST_REQUIRE(edge.next.has_value());
    BOOST_CHECK_EQUAL(edge.prev->getY(), 795.0);
    BOOST_CHECK_EQUAL(edge.next->getY(), 810.0);
    BOOST_CHECK_EQUAL(physics.lastFixture.categoryBits, CollisionCategory::TERRAIN);
}

BOOST_AUTO_TEST_CASE(SameWindowIsNoOp) {
    corridor.update(1000.0);
    const size_t created = physics.createdBodies;

    corridor.update(1000.0);
    corridor.update(1049.0);
    BOOST_CHECK_EQUAL(physics.createdBodies, created);
    BOOST_CHECK_EQUAL(physics.destroyedBodies, 0u);
}

BOOST_AUTO_TEST_CASE(MovingReusesOverlappingSegments) {
    corridor.update(1000.0);
    const BodyHandle kept = corridor.getSegments().at(900.0).leftBody;
    const size_t created = physics.createdBodies;

    corridor.update(1050.0);

    // [700, 750) dropped, [1300, 1350) added
    BOOST_CHECK_EQUAL(corridor.getSegmentCount(), 120u);
    BOOST_CHECK_EQUAL(physics.createdBodies - created, 20u);
    BOOST_CHECK_EQUAL(physics.destroyedBodies, 20u);
    BOOST_CHECK_EQUAL(corridor.getSegments().at(900.0).leftBody, kept);
    BOOST_CHECK(corridor.getSegments().count(700.0) == 0);
    BOOST_CHECK(corridor.getSegments().count(1345.0) == 1);
    BOOST_CHECK_EQUAL(physics.invalidDestroys, 0u);
}

BOOST_AUTO_TEST_CASE(MovingBackwardsWorksToo) {
    corridor.update(1000.0);
    corridor.update(-500.0);

    BOOST_CHECK_EQUAL(corridor.getSegmentCount(), 120u);
    BOOST_CHECK_EQUAL(physics.bodyCount(), 240u);
    BOOST_CHECK_EQUAL(*corridor.getWindowStart(), -800.0);
}

BOOST_AUTO_TEST_CASE(ClearDestroysEverything) {
    corridor.update(1000.0);
    corridor.clear();

    BOOST_CHECK_EQUAL(corridor.getSegmentCount(), 0u);
    BOOST_CHECK_EQUAL(physics.bodyCount(), 0u);
    BOOST_CHECK(!corridor.getWindowStart().has_value());
}

BOOST_AUTO_TEST_CASE(DestructorReleasesBodies) {
    MockPhysicsWorld world;
    {
        CollisionCorridor local(world, river);
        local.update(0.0);
        BOOST_CHECK_GT(world.bodyCount(), 0u);
    }
    BOOST_CHECK_EQUAL(world.bodyCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CorridorFailureTests, CorridorFixture)

BOOST_AUTO_TEST_CASE(LockedWorldLeavesWindowUncommitted) {
    physics.locked = true;
    corridor.update(1000.0);

    BOOST_CHECK_EQUAL(corridor.getSegmentCount(), 0u);
    BOOST_CHECK(!corridor.getWindowStart().has_value());
    BOOST_CHECK_GT(physics.refusedBodies, 0u);

    physics.locked = false;
    corridor.update(1000.0);
    BOOST_CHECK_EQUAL(corridor.getSegmentCount(), 120u);
    BOOST_CHECK_EQUAL(*corridor.getWindowStart(), 700.0);
}

BOOST_AUTO_TEST_CASE(PartialBuildIsKeptAndCompletedLater) {
    physics.bodyLimit = 100;
    corridor.update(1000.0);

    BOOST_CHECK_EQUAL(corridor.getSegmentCount(), 50u);
    BOOST_CHECK_EQUAL(physics.bodyCount(), 100u);
    BOOST_CHECK(!corridor.getWindowStart().has_value());

    physics.bodyLimit.reset();
    const size_t created = physics.createdBodies;
    corridor.update(1000.0);
    BOOST_CHECK_EQUAL(corridor.getSegmentCount(), 120u);
    BOOST_CHECK_EQUAL(physics.createdBodies - created, 140u);
}

BOOST_AUTO_TEST_CASE(HalfCreatedPairIsRolledBack) {
    physics.bodyLimit = 1;
    corridor.update(1000.0);
    BOOST_CHECK_EQUAL(corridor.getSegmentCount(), 0u);
    BOOST_CHECK_EQUAL(physics.bodyCount(), 0u);
}

BOOST_AUTO_TEST_CASE(RejectedFixtureReleasesBody) {
    physics.rejectFixtures = true;
    corridor.update(1000.0);
    BOOST_CHECK_EQUAL(corridor.getSegmentCount(), 0u);
    BOOST_CHECK_EQUAL(physics.bodyCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CorridorDebugTests, CorridorFixture)

BOOST_AUTO_TEST_CASE(DebugLinesFollowSegments) {
    corridor.update(1000.0);
    corridor.setDebug(true);
    BOOST_CHECK(corridor.isDebug());
    BOOST_CHECK_EQUAL(renderer.debugLines.size(), 240u);
    BOOST_CHECK_EQUAL(renderer.sceneCount(), 240u);

    corridor.update(1050.0);
    BOOST_CHECK_EQUAL(renderer.debugLines.size(), 240u);

    corridor.setDebug(false);
    BOOST_CHECK_EQUAL(renderer.debugLines.size(), 0u);
    BOOST_CHECK_EQUAL(renderer.sceneCount(), 0u);
    BOOST_CHECK_EQUAL(renderer.invalidDestroys, 0u);
}

BOOST_AUTO_TEST_CASE(NewSegmentsGetLinesWhileDebugging) {
    corridor.setDebug(true);
    corridor.update(0.0);
    BOOST_CHECK_EQUAL(renderer.debugLines.size(), 2 * corridor.getSegmentCount());

    corridor.clear();
    BOOST_CHECK_EQUAL(renderer.liveCount(), 0u);
}

BOOST_AUTO_TEST_CASE(DebugWithoutRendererIsIgnored) {
    MockPhysicsWorld world;
    CollisionCorridor headless(world, river);
    headless.setDebug(true);
    BOOST_CHECK(!headless.isDebug());
}

BOOST_AUTO_TEST_SUITE_END()
