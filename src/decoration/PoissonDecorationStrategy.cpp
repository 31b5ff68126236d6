/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "decoration/PoissonDecorationStrategy.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace RiverForge {

namespace {

constexpr double TWO_PI = 2.0 * 3.14159265358979323846;
constexpr double MIN_GROUND_RADIUS = 0.01;

} // namespace

PoissonDecorationStrategy::PoissonDecorationStrategy(const PerlinNoise& noise,
                                                     const PoissonConfig& config)
    : m_noise(noise), m_config(config) {
    if (config.seedAttempts < 0) {
        throw std::invalid_argument("PoissonConfig seedAttempts must be >= 0, got " +
                                    std::to_string(config.seedAttempts));
    }
    if (config.maxK < 1) {
        throw std::invalid_argument("PoissonConfig maxK must be >= 1, got " +
                                    std::to_string(config.maxK));
    }
}

std::optional<DecorationPlacement> PoissonDecorationStrategy::tryPlace(
    double x, double z, const DecorationRule& rule, SpatialGrid& spatialGrid,
    const TerrainSampler& terrainSampler,
    const BiomeProgressSampler& biomeProgressSampler, std::mt19937& rng) const {

    const TerrainSample sample = terrainSampler.sampleTerrain(x, z);
    DecorationContext ctx{x, z, sample.height, sample.slope, sample.distanceToRiver,
                          biomeProgressSampler ? biomeProgressSampler(z) : 0.0,
                          rng, m_noise};

    const double fitness = std::min(1.0, rule.fitness(ctx));
    if (!(fitness > 0.0)) {
        return std::nullopt;
    }

    std::uniform_real_distribution<double> chance(0.0, 1.0);
    if (chance(rng) > fitness) {
        return std::nullopt;
    }

    std::optional<PlacementParams> params = rule.generate(ctx);
    if (!params) {
        return std::nullopt;
    }

    const double groundRadius = std::max(MIN_GROUND_RADIUS, params->groundRadius);
    if (spatialGrid.checkCollision(x, z, groundRadius, params->canopyRadius,
                                   params->speciesRadius, params->speciesId)) {
        return std::nullopt;
    }

    DecorationPlacement placement;
    placement.x = x;
    placement.y = sample.height;
    placement.z = z;
    placement.groundRadius = groundRadius;
    placement.canopyRadius = params->canopyRadius;
    placement.speciesRadius = params->speciesRadius;
    placement.fitness = fitness;
    placement.speciesId = std::move(params->speciesId);
    placement.options = std::move(params->options);

    spatialGrid.insert(placement);
    return placement;
}

std::vector<DecorationPlacement> PoissonDecorationStrategy::generate(
    const DecorationRuleList& rules, const Region& region, SpatialGrid& spatialGrid,
    const TerrainSampler& terrainSampler,
    const BiomeProgressSampler& biomeProgressSampler, uint32_t seed) const {

    std::vector<DecorationPlacement> placements;
    if (region.empty()) {
        DECORATION_WARN("Skipping empty region z=[" + std::to_string(region.zMin) + ", " +
                        std::to_string(region.zMax) + ")");
        return placements;
    }

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> xDist(region.xMin, region.xMax);
    std::uniform_real_distribution<double> zDist(region.zMin, region.zMax);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    std::vector<DecorationPlacement> active;
    std::vector<double> distances;
    distances.reserve(3);

    for (const auto& rulePtr : rules) {
        if (!rulePtr) {
            continue;
        }
        const DecorationRule& rule = *rulePtr;
        const size_t before = placements.size();
        active.clear();

        for (int i = 0; i < m_config.seedAttempts; ++i) {
            const double x = xDist(rng);
            const double z = zDist(rng);
            if (auto placed = tryPlace(x, z, rule, spatialGrid, terrainSampler,
                                       biomeProgressSampler, rng)) {
                active.push_back(*placed);
                placements.push_back(std::move(*placed));
            }
        }

        while (!active.empty()) {
            std::uniform_int_distribution<size_t> pick(0, active.size() - 1);
            const size_t parentIndex = pick(rng);
            const DecorationPlacement parent = active[parentIndex];

            const int dynamicK = std::max(
                1, static_cast<int>(std::floor(m_config.maxK * parent.fitness)));

            bool placedChild = false;
            for (int k = 0; k < dynamicK && !placedChild; ++k) {
                const double angle = unit(rng) * TWO_PI;

                distances.clear();
                distances.push_back(2.0 * parent.groundRadius * (1.0 + unit(rng)));
                if (parent.canopyRadius > 0.0) {
                    distances.push_back(2.0 * parent.canopyRadius * (1.0 + unit(rng)));
                }
                if (parent.speciesRadius > 0.0) {
                    distances.push_back(2.0 * parent.speciesRadius * (1.0 + unit(rng)));
                }

                for (double distance : distances) {
                    const double x = parent.x + std::cos(angle) * distance;
                    const double z = parent.z + std::sin(angle) * distance;
                    if (!region.contains(x, z)) {
                        continue;
                    }
                    if (auto placed = tryPlace(x, z, rule, spatialGrid, terrainSampler,
                                               biomeProgressSampler, rng)) {
                        active.push_back(*placed);
                        placements.push_back(std::move(*placed));
                        placedChild = true;
                        break;
                    }
                }
            }

            if (!placedChild) {
                active[parentIndex] = std::move(active.back());
                active.pop_back();
            }
        }

        DECORATION_DEBUG("Rule '" + rule.id() + "' placed " +
                         std::to_string(placements.size() - before) + " decorations");
    }

    return placements;
}

} // namespace RiverForge
