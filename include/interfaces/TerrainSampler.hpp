/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TERRAIN_SAMPLER_HPP
#define TERRAIN_SAMPLER_HPP

namespace RiverForge {

struct TerrainSample {
    double height{0.0};
    double slope{0.0};            // radians from horizontal
    double distanceToRiver{0.0};  // signed, negative inside the river
};

/**
 * @brief Environment queries used by decoration placement
 */
class TerrainSampler {
public:
    virtual ~TerrainSampler() = default;

    virtual TerrainSample sampleTerrain(double x, double z) const = 0;

    /**
     * @brief Progress through the biome that contains z
     * @return value in [0, 1]
     */
    virtual double sampleBiomeProgress(double z) const = 0;

    /**
     * @brief Whether a point at (x, height, z) can be seen from the river
     * @details Terrain without occluders sees everything.
     */
    virtual bool isVisibleFromRiver(double x, double height, double z) const {
        (void)x;
        (void)height;
        (void)z;
        return true;
    }
};

/**
 * @brief River centreline and width along the traversal axis
 */
class RiverProfile {
public:
    virtual ~RiverProfile() = default;

    virtual double getRiverCenter(double z) const = 0;
    virtual double getRiverWidth(double z) const = 0;

    double getLeftBank(double z) const {
        return getRiverCenter(z) - getRiverWidth(z) / 2.0;
    }

    double getRightBank(double z) const {
        return getRiverCenter(z) + getRiverWidth(z) / 2.0;
    }
};

} // namespace RiverForge

#endif // TERRAIN_SAMPLER_HPP
