/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TerrainGeometryTests
#include <boost/test/unit_test.hpp>

#include "managers/BiomeManager.hpp"
#include "mocks/MockTerrain.hpp"
#include "world/RiverSystem.hpp"
#include "world/TerrainGeometry.hpp"
#include <cmath>

using namespace RiverForge;

namespace {

// Relies on the base visibility query
class OpenSampler : public TerrainSampler {
public:
    TerrainSample sampleTerrain(double, double) const override { return TerrainSample{}; }
    double sampleBiomeProgress(double) const override { return 0.0; }
};

} // namespace

struct WorldFixture {
    WorldFixture() : river(biomes, 100), straight(40.0), terrain(straight, biomes, 200) {
        biomes.ensureWindow(-3000.0, 3000.0);
    }

    BiomeManager biomes;
    RiverSystem river;
    StraightRiver straight;
    TerrainGeometry terrain;
};

BOOST_FIXTURE_TEST_SUITE(RiverSystemTests, WorldFixture)

BOOST_AUTO_TEST_CASE(CenterStaysWithinAmplitude) {
    for (double z = -2500.0; z < 2500.0; z += 13.0) {
        const double center = river.getRiverCenter(z);
        BOOST_CHECK_LE(std::abs(center), RiverSystem::PATH_AMPLITUDE);
    }
}

BOOST_AUTO_TEST_CASE(WidthNeverBelowMinimum) {
    for (double z = -2500.0; z < 2500.0; z += 13.0) {
        BOOST_CHECK_GE(river.getRiverWidth(z), RiverSystem::MIN_WIDTH);
    }
}

BOOST_AUTO_TEST_CASE(BanksStraddleCenter) {
    const double z = 321.0;
    BOOST_CHECK_LT(river.getLeftBank(z), river.getRiverCenter(z));
    BOOST_CHECK_GT(river.getRightBank(z), river.getRiverCenter(z));
    BOOST_CHECK_CLOSE(river.getRightBank(z) - river.getLeftBank(z), river.getRiverWidth(z),
                      1e-9);
}

BOOST_AUTO_TEST_CASE(SameSeedSamePath) {
    RiverSystem other(biomes, 100);
    for (double z : {-1000.0, 0.0, 17.5, 2400.0}) {
        BOOST_CHECK_EQUAL(river.getRiverCenter(z), other.getRiverCenter(z));
        BOOST_CHECK_EQUAL(river.getRiverWidth(z), other.getRiverWidth(z));
    }
}

BOOST_AUTO_TEST_CASE(DerivativeMatchesFiniteDifference) {
    const double z = 555.0;
    const double expected = (river.getRiverCenter(z + 1.0) - river.getRiverCenter(z - 1.0)) / 2.0;
    BOOST_CHECK_CLOSE(river.getRiverDerivative(z) + 10.0, expected + 10.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(DistanceToWaterFromCenterIsZero) {
    const double z = 100.0;
    const Vector2D start(river.getRiverCenter(z), z);
    BOOST_CHECK_EQUAL(river.getDistanceToWater(start, Vector2D(1.0, 0.0)), 0.0);
}

BOOST_AUTO_TEST_CASE(DistanceToWaterWalksTowardsRiver) {
    const double z = 100.0;
    const Vector2D start(river.getRightBank(z) + 30.0, z);
    const double distance = river.getDistanceToWater(start, Vector2D(-1.0, 0.0));
    BOOST_CHECK_GT(distance, 29.0);
    BOOST_CHECK_LT(distance, 33.0);
}

BOOST_AUTO_TEST_CASE(DistanceToWaterGivesUpWhenFacingAway) {
    const double z = 100.0;
    const Vector2D start(river.getRightBank(z) + 30.0, z);
    BOOST_CHECK_EQUAL(river.getDistanceToWater(start, Vector2D(1.0, 0.0)), -1.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TerrainHeightTests, WorldFixture)

BOOST_AUTO_TEST_CASE(RiverBedIsDeepestAtCenter) {
    BOOST_CHECK_CLOSE(terrain.calculateHeight(0.0, 50.0), -TerrainGeometry::RIVER_DEPTH, 1e-9);
    BOOST_CHECK_LT(terrain.calculateHeight(0.0, 50.0), terrain.calculateHeight(10.0, 50.0));
}

BOOST_AUTO_TEST_CASE(RiverBedIsUnderwater) {
    for (double x = -15.0; x <= 15.0; x += 1.5) {
        BOOST_CHECK_LT(terrain.calculateHeight(x, 200.0), 0.0);
    }
}

BOOST_AUTO_TEST_CASE(LandStaysAboveWater) {
    for (double x = 30.0; x < 400.0; x += 9.0) {
        BOOST_CHECK_GT(terrain.calculateHeight(x, 200.0), 0.0);
        BOOST_CHECK_GT(terrain.calculateHeight(-x, -700.0), 0.0);
    }
}

BOOST_AUTO_TEST_CASE(PointInRiverUsesBanks) {
    BOOST_CHECK(terrain.isPointInRiver(0.0, 0.0));
    BOOST_CHECK(terrain.isPointInRiver(19.9, 0.0));
    BOOST_CHECK(!terrain.isPointInRiver(20.1, 0.0));
    BOOST_CHECK(!terrain.isPointInRiver(-25.0, 0.0));
}

BOOST_AUTO_TEST_CASE(NormalIsUnitAndUpward) {
    for (double x : {-300.0, -60.0, 45.0, 180.0}) {
        const Normal3D n = terrain.calculateNormal(x, 123.0);
        BOOST_CHECK_CLOSE(std::sqrt(n.x * n.x + n.y * n.y + n.z * n.z), 1.0, 1e-6);
        BOOST_CHECK_GT(n.y, 0.0);
    }
}

BOOST_AUTO_TEST_CASE(RiverNormalIsFlat) {
    const Normal3D n = terrain.calculateNormal(5.0, 123.0);
    BOOST_CHECK_EQUAL(n.y, 1.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TerrainSamplerTests, WorldFixture)

BOOST_AUTO_TEST_CASE(SampleReportsSignedRiverDistance) {
    BOOST_CHECK_CLOSE(terrain.sampleTerrain(100.0, 0.0).distanceToRiver, 80.0, 1e-9);
    BOOST_CHECK_CLOSE(terrain.sampleTerrain(-30.0, 0.0).distanceToRiver, 10.0, 1e-9);
    BOOST_CHECK_CLOSE(terrain.sampleTerrain(0.0, 0.0).distanceToRiver, -20.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(SampleSlopeIsZeroInRiver) {
    const TerrainSample sample = terrain.sampleTerrain(3.0, 40.0);
    BOOST_CHECK_EQUAL(sample.slope, 0.0);
    BOOST_CHECK_EQUAL(sample.height, terrain.calculateHeight(3.0, 40.0));
}

BOOST_AUTO_TEST_CASE(SlopeWithinRightAngle) {
    for (double x = 25.0; x < 300.0; x += 11.0) {
        const double slope = terrain.sampleTerrain(x, 77.0).slope;
        BOOST_CHECK_GE(slope, 0.0);
        BOOST_CHECK_LT(slope, 3.14159265358979323846 / 2.0);
    }
}

BOOST_AUTO_TEST_CASE(BiomeProgressComesFromBiomes) {
    for (double z : {-2000.0, 10.0, 750.0}) {
        BOOST_CHECK_EQUAL(terrain.sampleBiomeProgress(z), biomes.getBiomeProgress(z));
    }
}

BOOST_AUTO_TEST_CASE(PointsOnTheWaterAreVisible) {
    BOOST_CHECK(terrain.checkVisibility(10.0, 2.0, 60.0));
    BOOST_CHECK(terrain.isVisibleFromRiver(-12.0, 3.0, 60.0));
}

BOOST_AUTO_TEST_CASE(SamplerWithoutOccludersSeesEverything) {
    BOOST_CHECK(OpenSampler{}.isVisibleFromRiver(1e4, -100.0, 0.0));
}

BOOST_AUTO_TEST_SUITE_END()
