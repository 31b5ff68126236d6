/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE FitnessTests
#include <boost/test/unit_test.hpp>

#include "decoration/Fitness.hpp"
#include "world/PerlinNoise.hpp"
#include <cmath>
#include <random>
#include <stdexcept>

using namespace RiverForge;

struct FitnessFixture {
    FitnessFixture() : rng(7), noise(11), ctx{0.0, 0.0, 0.0, 0.0, 0.0, 0.0, rng, noise} {}

    double at(const FitnessPtr& f, double distance) {
        ctx.distanceToRiver = distance;
        return f->evaluate(ctx);
    }

    std::mt19937 rng;
    PerlinNoise noise;
    DecorationContext ctx;
};

BOOST_FIXTURE_TEST_SUITE(SignalTests, FitnessFixture)

BOOST_AUTO_TEST_CASE(ConstantIgnoresContext) {
    auto f = Signal::constant(0.3);
    BOOST_CHECK_CLOSE(at(f, 0.0), 0.3, 1e-9);
    BOOST_CHECK_CLOSE(at(f, 500.0), 0.3, 1e-9);
}

BOOST_AUTO_TEST_CASE(FieldSignalsReadContext) {
    ctx.elevation = 12.5;
    ctx.biomeProgress = 0.25;
    ctx.slope = std::atan(1.0);  // 45 degrees
    BOOST_CHECK_CLOSE(Signal::elevation()->evaluate(ctx), 12.5, 1e-9);
    BOOST_CHECK_CLOSE(Signal::biomeProgress()->evaluate(ctx), 0.25, 1e-9);
    BOOST_CHECK_CLOSE(Signal::slope()->evaluate(ctx), 45.0, 1e-6);
    BOOST_CHECK_CLOSE(at(Signal::distanceToRiver(), -3.0), -3.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(NoiseStaysInUnitInterval) {
    auto f = Signal::noise2D(10.0, 10.0);
    for (int i = 0; i < 200; ++i) {
        ctx.x = i * 3.7 - 300.0;
        ctx.z = i * -5.3 + 40.0;
        const double v = f->evaluate(ctx);
        BOOST_CHECK_GE(v, 0.0);
        BOOST_CHECK_LE(v, 1.0);
    }
}

BOOST_AUTO_TEST_CASE(NoiseIsDeterministic) {
    auto f = Signal::noise2D(25.0, 40.0, 3.0, 1.0);
    ctx.x = 17.0;
    ctx.z = -83.0;
    const double first = f->evaluate(ctx);
    BOOST_CHECK_EQUAL(f->evaluate(ctx), first);
}

BOOST_AUTO_TEST_CASE(InRangeIsInclusive) {
    auto f = Signal::inRange(Signal::distanceToRiver(), 5.0, 10.0);
    BOOST_CHECK_EQUAL(at(f, 4.9), 0.0);
    BOOST_CHECK_EQUAL(at(f, 5.0), 1.0);
    BOOST_CHECK_EQUAL(at(f, 10.0), 1.0);
    BOOST_CHECK_EQUAL(at(f, 10.1), 0.0);
}

BOOST_AUTO_TEST_CASE(InRangeDefaultsToUnboundedMax) {
    auto f = Signal::inRange(Signal::distanceToRiver(), 5.0);
    BOOST_CHECK_EQUAL(at(f, 1e9), 1.0);
}

BOOST_AUTO_TEST_CASE(StepSwitchesAtThreshold) {
    auto f = Signal::step(Signal::distanceToRiver(), 2.0);
    BOOST_CHECK_EQUAL(at(f, 1.99), 0.0);
    BOOST_CHECK_EQUAL(at(f, 2.0), 1.0);
}

BOOST_AUTO_TEST_CASE(LinearEaseInRamps) {
    auto f = Signal::linearEaseIn(Signal::distanceToRiver(), 0.0, 10.0);
    BOOST_CHECK_EQUAL(at(f, -5.0), 0.0);
    BOOST_CHECK_CLOSE(at(f, 2.5), 0.25, 1e-9);
    BOOST_CHECK_EQUAL(at(f, 10.0), 1.0);
    BOOST_CHECK_EQUAL(at(f, 50.0), 1.0);
}

BOOST_AUTO_TEST_CASE(LinearEaseOutFalls) {
    auto f = Signal::linearEaseOut(Signal::distanceToRiver(), 100.0, 200.0);
    BOOST_CHECK_EQUAL(at(f, 50.0), 1.0);
    BOOST_CHECK_CLOSE(at(f, 150.0), 0.5, 1e-9);
    BOOST_CHECK_EQUAL(at(f, 250.0), 0.0);
}

BOOST_AUTO_TEST_CASE(EaseRejectsDegenerateRanges) {
    BOOST_CHECK_THROW(Signal::linearEaseIn(Signal::distanceToRiver(), 5.0, 5.0),
                      std::invalid_argument);
    BOOST_CHECK_THROW(Signal::linearEaseOut(Signal::distanceToRiver(), 10.0, 2.0),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(SmoothRangeHasPlateau) {
    auto f = Signal::smoothRange(Signal::distanceToRiver(), 0.0, 10.0, 20.0, 30.0);
    BOOST_CHECK_EQUAL(at(f, -1.0), 0.0);
    BOOST_CHECK_CLOSE(at(f, 5.0), 0.5, 1e-9);
    BOOST_CHECK_CLOSE(at(f, 15.0), 1.0, 1e-9);
    BOOST_CHECK_CLOSE(at(f, 25.0), 0.5, 1e-9);
    BOOST_CHECK_EQUAL(at(f, 31.0), 0.0);
}

BOOST_AUTO_TEST_CASE(SmoothRangeWithoutUpperBound) {
    auto f = Signal::smoothRange(Signal::distanceToRiver(), 0.0, 10.0);
    BOOST_CHECK_CLOSE(at(f, 1e6), 1.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(MaxPicksLarger) {
    auto f = Signal::max(Signal::constant(0.2), Signal::distanceToRiver());
    BOOST_CHECK_CLOSE(at(f, 0.1), 0.2, 1e-9);
    BOOST_CHECK_CLOSE(at(f, 0.7), 0.7, 1e-9);
}

BOOST_AUTO_TEST_CASE(NullInputsThrow) {
    BOOST_CHECK_THROW(Signal::inRange(nullptr, 0.0, 1.0), std::invalid_argument);
    BOOST_CHECK_THROW(Signal::step(nullptr, 0.5), std::invalid_argument);
    BOOST_CHECK_THROW(Signal::max(Signal::constant(1.0), nullptr), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CombineTests, FitnessFixture)

BOOST_AUTO_TEST_CASE(AllMultiplies) {
    auto f = Combine::all({Signal::constant(0.5), Signal::constant(0.4)});
    BOOST_CHECK_CLOSE(f->evaluate(ctx), 0.2, 1e-9);
}

BOOST_AUTO_TEST_CASE(AllOfNothingIsOne) {
    BOOST_CHECK_EQUAL(Combine::all({})->evaluate(ctx), 1.0);
}

BOOST_AUTO_TEST_CASE(AnyTakesMaximum) {
    auto f = Combine::any({Signal::constant(0.1), Signal::constant(0.6), Signal::constant(0.3)});
    BOOST_CHECK_CLOSE(f->evaluate(ctx), 0.6, 1e-9);
}

BOOST_AUTO_TEST_CASE(AnyOfNothingIsZero) {
    BOOST_CHECK_EQUAL(Combine::any({})->evaluate(ctx), 0.0);
}

BOOST_AUTO_TEST_CASE(CombinatorsNest) {
    auto f = Combine::any({Combine::all({Signal::constant(0.5), Signal::constant(0.5)}),
                           Signal::constant(0.2)});
    BOOST_CHECK_CLOSE(f->evaluate(ctx), 0.25, 1e-9);
}

BOOST_AUTO_TEST_CASE(NullPartThrows) {
    BOOST_CHECK_THROW(Combine::all({Signal::constant(1.0), nullptr}), std::invalid_argument);
    BOOST_CHECK_THROW(Combine::any({nullptr}), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(MakeFitnessTests, FitnessFixture)

BOOST_AUTO_TEST_CASE(DefaultIsOne) {
    BOOST_CHECK_EQUAL(makeFitness(FitnessParams{})->evaluate(ctx), 1.0);
}

BOOST_AUTO_TEST_CASE(BaseFitnessScalesProduct) {
    FitnessParams params;
    params.fitness = 0.4;
    params.linearEaseIn = Range{0.0, 10.0};
    auto f = makeFitness(params);
    BOOST_CHECK_CLOSE(at(f, 5.0), 0.2, 1e-9);
    BOOST_CHECK_EQUAL(at(f, -1.0), 0.0);
}

BOOST_AUTO_TEST_CASE(StepDistanceGatesOnRiverDistance) {
    FitnessParams params;
    params.stepDistance = Range{10.0, 40.0};
    auto f = makeFitness(params);
    BOOST_CHECK_EQUAL(at(f, 5.0), 0.0);
    BOOST_CHECK_EQUAL(at(f, 20.0), 1.0);
    BOOST_CHECK_EQUAL(at(f, 45.0), 0.0);
}

BOOST_AUTO_TEST_CASE(ElevationAndSlopeGates) {
    FitnessParams params;
    params.elevation = Range{0.0, 20.0};
    params.slope = Range{0.0, 30.0};
    auto f = makeFitness(params);

    ctx.elevation = 10.0;
    ctx.slope = 0.1;
    BOOST_CHECK_EQUAL(f->evaluate(ctx), 1.0);

    ctx.slope = 1.0;  // ~57 degrees
    BOOST_CHECK_EQUAL(f->evaluate(ctx), 0.0);

    ctx.slope = 0.1;
    ctx.elevation = 25.0;
    BOOST_CHECK_EQUAL(f->evaluate(ctx), 0.0);
}

BOOST_AUTO_TEST_CASE(MinFitnessFloorsTheProduct) {
    FitnessParams params;
    params.minFitness = 0.05;
    params.stepDistance = Range{10.0, 40.0};
    auto f = makeFitness(params);
    BOOST_CHECK_CLOSE(at(f, 0.0), 0.05, 1e-9);
    BOOST_CHECK_EQUAL(at(f, 20.0), 1.0);
}

BOOST_AUTO_TEST_CASE(StepNoiseIsBinary) {
    FitnessParams params;
    params.stepNoise = StepNoiseParams{30.0, 30.0, 0.5, 0.0, 0.0};
    auto f = makeFitness(params);
    for (int i = 0; i < 50; ++i) {
        ctx.x = i * 7.1;
        ctx.z = i * -3.3;
        const double v = f->evaluate(ctx);
        BOOST_CHECK(v == 0.0 || v == 1.0);
    }
}

BOOST_AUTO_TEST_SUITE_END()
