/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DECORATION_CONTEXT_HPP
#define DECORATION_CONTEXT_HPP

#include "world/PerlinNoise.hpp"
#include <algorithm>
#include <cstdint>
#include <random>
#include <string>

namespace RiverForge {

/**
 * @brief Local environment at a candidate decoration point
 *
 * Fitness functions read only the sampled fields and noise. The random
 * source is there for species parameter generation.
 */
struct DecorationContext {
    double x{0.0};
    double z{0.0};
    double elevation{0.0};
    double slope{0.0};              // radians
    double distanceToRiver{0.0};
    double biomeProgress{0.0};
    std::mt19937& rng;
    const PerlinNoise& noise;

    double random() const {
        return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
    }

    double gaussian() const {
        return std::normal_distribution<double>(0.0, 1.0)(rng);
    }

    double noise2D(double nx, double nz) const {
        return noise.noise(nx, nz);
    }
};

/**
 * @brief Look and asset requirements of a placed decoration
 */
struct RenderOptions {
    std::string kind;          // "oak", "rock", ...
    std::string assetId;       // asset that must be resident before instancing
    std::string materialId;    // instances sharing a material are merged
    double scale{1.0};
    double rotation{0.0};
    uint32_t color{0xFFFFFF};
    bool spawnsEntity{false};  // handed to the entity manager instead of instanced
};

/**
 * @brief Instance parameters produced by a rule for an accepted point
 */
struct PlacementParams {
    std::string speciesId;
    double groundRadius{0.0};
    double canopyRadius{0.0};
    double speciesRadius{0.0};
    RenderOptions options;
};

/**
 * @brief Immutable record of one accepted decoration
 */
struct DecorationPlacement {
    double x{0.0};
    double y{0.0};
    double z{0.0};
    double groundRadius{0.0};
    double canopyRadius{0.0};
    double speciesRadius{0.0};
    double fitness{0.0};
    std::string speciesId;
    RenderOptions options;

    double maxRadius() const {
        return std::max(groundRadius, std::max(canopyRadius, speciesRadius));
    }
};

} // namespace RiverForge

#endif // DECORATION_CONTEXT_HPP
