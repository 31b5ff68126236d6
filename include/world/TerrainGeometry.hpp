/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TERRAIN_GEOMETRY_HPP
#define TERRAIN_GEOMETRY_HPP

#include "interfaces/TerrainSampler.hpp"
#include "world/PerlinNoise.hpp"

namespace RiverForge {

class BiomeManager;

struct Normal3D {
    double x{0.0};
    double y{1.0};
    double z{0.0};
};

/**
 * @brief Height field of the river valley
 *
 * Land is a mix of rolling hills and ridged mountains scaled by the biome
 * amplitude. The river bed is a parabola of depth RIVER_DEPTH, blended into
 * the land across BANK_TRANSITION units around the bank.
 */
class TerrainGeometry : public TerrainSampler {
public:
    static constexpr double RIVER_DEPTH = 8.0;
    static constexpr double BANK_TRANSITION = 8.0;
    static constexpr double MIN_LAND_HEIGHT = 2.0;

    TerrainGeometry(const RiverProfile& river, const BiomeManager& biomeManager,
                    unsigned int seed = 200);

    double calculateHeight(double x, double z) const;
    Normal3D calculateNormal(double x, double z) const;
    bool isPointInRiver(double x, double z) const;

    /**
     * @brief Line-of-sight test from the river centre (height 2) to a target
     * @param steps number of samples along the ray
     * @return false if terrain rises more than 0.5 above the ray
     */
    bool checkVisibility(double targetX, double targetHeight, double z,
                         int steps = 4) const;

    // TerrainSampler
    TerrainSample sampleTerrain(double x, double z) const override;
    double sampleBiomeProgress(double z) const override;
    bool isVisibleFromRiver(double x, double height, double z) const override;

private:
    const RiverProfile& m_river;
    const BiomeManager& m_biomeManager;
    PerlinNoise m_noise;

    double rawLandHeight(double x, double z) const;
    static double rawRiverHeight(double distFromCenter, double riverEdge);
};

} // namespace RiverForge

#endif // TERRAIN_GEOMETRY_HPP
