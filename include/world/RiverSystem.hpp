/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef RIVER_SYSTEM_HPP
#define RIVER_SYSTEM_HPP

#include "interfaces/TerrainSampler.hpp"
#include "utils/Vector2D.hpp"
#include "world/PerlinNoise.hpp"

namespace RiverForge {

class BiomeManager;

/**
 * @brief Noise-driven river centreline and biome-scaled width
 */
class RiverSystem : public RiverProfile {
public:
    static constexpr double PATH_SCALE = 0.002;      // ~500 unit wavelength
    static constexpr double PATH_AMPLITUDE = 100.0;
    static constexpr double WIDTH_SCALE = 0.002;
    static constexpr double MIN_WIDTH = 15.0;
    static constexpr double MAX_WIDTH = 75.0;

    RiverSystem(const BiomeManager& biomeManager, unsigned int seed = 100);

    double getRiverCenter(double z) const override;
    double getRiverWidth(double z) const override;

    // dx/dz of the centreline by central difference
    double getRiverDerivative(double z) const;

    /**
     * @brief Ray-march from a point until it is inside the water
     * @param start (x, z) start position
     * @param direction normalized (x, z) direction
     * @return distance travelled, or -1 if no water within 200 units
     */
    double getDistanceToWater(const Vector2D& start, const Vector2D& direction) const;

private:
    const BiomeManager& m_biomeManager;
    PerlinNoise m_noise;
};

} // namespace RiverForge

#endif // RIVER_SYSTEM_HPP
