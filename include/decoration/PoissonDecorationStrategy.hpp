/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POISSON_DECORATION_STRATEGY_HPP
#define POISSON_DECORATION_STRATEGY_HPP

#include "decoration/DecorationRule.hpp"
#include "decoration/SpatialGrid.hpp"
#include "interfaces/TerrainSampler.hpp"
#include "world/PerlinNoise.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <vector>

namespace RiverForge {

struct PoissonConfig {
    int seedAttempts{100};  // uniform seeding candidates per rule
    int maxK{30};           // growth attempts for a parent of fitness 1
};

/**
 * @brief Axis-aligned placement area. x is closed, z is half-open.
 */
struct Region {
    double xMin{0.0};
    double xMax{0.0};
    double zMin{0.0};
    double zMax{0.0};

    bool contains(double x, double z) const {
        return x >= xMin && x <= xMax && z >= zMin && z < zMax;
    }

    bool empty() const { return !(xMax > xMin) || !(zMax > zMin); }
};

using BiomeProgressSampler = std::function<double(double z)>;

/**
 * @brief Fitness-weighted Poisson-disk sampler
 *
 * Rules are processed in order against a shared SpatialGrid, so a later
 * rule fills the gaps an earlier one left. Each rule seeds uniformly, then
 * grows outward from accepted points at 2-4x each radius class. A parent
 * with fitness f gets max(1, floor(maxK * f)) growth attempts, so dense
 * clusters form where fitness is high.
 */
class PoissonDecorationStrategy {
public:
    explicit PoissonDecorationStrategy(const PerlinNoise& noise,
                                       const PoissonConfig& config = PoissonConfig{});

    /**
     * @brief Places decorations for every rule inside region
     * @param rules processed in the given order
     * @param region placement bounds
     * @param spatialGrid receives every accepted placement
     * @param terrainSampler elevation, slope and river distance source
     * @param biomeProgressSampler progress through the containing biome
     * @param seed identical inputs and seed give identical output
     * @return accepted placements in acceptance order
     */
    std::vector<DecorationPlacement> generate(const DecorationRuleList& rules,
                                              const Region& region,
                                              SpatialGrid& spatialGrid,
                                              const TerrainSampler& terrainSampler,
                                              const BiomeProgressSampler& biomeProgressSampler,
                                              uint32_t seed) const;

    const PoissonConfig& getConfig() const { return m_config; }

private:
    const PerlinNoise& m_noise;
    PoissonConfig m_config;

    std::optional<DecorationPlacement> tryPlace(double x, double z,
                                                const DecorationRule& rule,
                                                SpatialGrid& spatialGrid,
                                                const TerrainSampler& terrainSampler,
                                                const BiomeProgressSampler& biomeProgressSampler,
                                                std::mt19937& rng) const;
};

} // namespace RiverForge

#endif // POISSON_DECORATION_STRATEGY_HPP
