/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FITNESS_HPP
#define FITNESS_HPP

/**
 * @file Fitness.hpp
 * @brief Composable placement fitness functions
 *
 * A fitness maps a DecorationContext to a score. Scores in [0, 1] act as
 * placement probability. Signals read raw values (distance to river,
 * elevation, ...), shaping functions turn them into scores, and Combine
 * merges scores: all() is a product (AND of probabilities) and any() a
 * maximum (OR of conditions).
 */

#include "decoration/DecorationContext.hpp"
#include <limits>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace RiverForge {

class Fitness {
public:
    virtual ~Fitness() = default;
    virtual double evaluate(const DecorationContext& ctx) const = 0;
};

using FitnessPtr = std::shared_ptr<const Fitness>;

namespace Signal {

constexpr double UNBOUNDED = std::numeric_limits<double>::infinity();

FitnessPtr constant(double value);

// Noise scaled to [0, 1]. Larger scales vary more slowly.
FitnessPtr noise2D(double scaleX, double scaleZ, double offsetX = 0.0,
                   double offsetZ = 0.0);

FitnessPtr distanceToRiver();
FitnessPtr elevation();
FitnessPtr slope();            // degrees
FitnessPtr biomeProgress();

// 1 if min <= v <= max, else 0
FitnessPtr inRange(FitnessPtr f, double min, double max = UNBOUNDED);

// 0 if v < threshold, else 1
FitnessPtr step(FitnessPtr f, double threshold);

// 0 up to min0, rising linearly to 1 at min1
FitnessPtr linearEaseIn(FitnessPtr f, double min0, double min1);

// 1 up to max1, falling linearly to 0 at max0
FitnessPtr linearEaseOut(FitnessPtr f, double max1, double max0);

// Smoothstep up over [min0, min1], 1 until max1, smoothstep down to max0
FitnessPtr smoothRange(FitnessPtr f, double min0, double min1,
                       double max1 = UNBOUNDED, double max0 = UNBOUNDED);

FitnessPtr max(FitnessPtr a, FitnessPtr b);

} // namespace Signal

namespace Combine {

FitnessPtr all(std::vector<FitnessPtr> parts);
FitnessPtr any(std::vector<FitnessPtr> parts);

} // namespace Combine

using Range = std::pair<double, double>;

struct StepNoiseParams {
    double scaleX{1.0};
    double scaleZ{1.0};
    double threshold{0.5};
    double offsetX{0.0};
    double offsetZ{0.0};
};

/**
 * @brief Declarative description of a product-of-conditions fitness
 *
 * River distance ranges apply to distanceToRiver. minFitness, when set,
 * floors the whole product.
 */
struct FitnessParams {
    double fitness{1.0};
    std::optional<double> minFitness;
    std::optional<Range> linearEaseIn;
    std::optional<Range> linearEaseOut;
    std::optional<Range> stepDistance;
    std::optional<StepNoiseParams> stepNoise;
    std::optional<Range> elevation;
    std::optional<Range> slope;
};

FitnessPtr makeFitness(const FitnessParams& params);

} // namespace RiverForge

#endif // FITNESS_HPP
