/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STREAMING_CONFIG_HPP
#define STREAMING_CONFIG_HPP

#include "collisions/CollisionCorridor.hpp"
#include "decoration/PoissonDecorationStrategy.hpp"
#include "managers/BiomeManager.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace RiverForge {

class JsonValue;

/**
 * @brief Tunables of the streaming core
 *
 * Defaults describe the shipped world. loadFromFile() overrides any subset of
 * them from the JSON sections "streaming", "collision", "decoration" and
 * "biomes"; missing keys keep their current value.
 */
struct StreamingConfig {
    // Chunk geometry
    double chunkSize{62.5};
    double chunkWidth{400.0};
    int resolutionX{160};
    int resolutionZ{25};
    int meshRowsPerStep{5};

    // Streaming window
    int renderDistance{7};
    size_t maxConcurrentLoads{3};
    double cleanupMargin{2000.0};
    int maxConstructionRetries{2};
    bool designerMode{false};
    double visibilityRadius{360.0};

    uint32_t worldSeed{42};
    double decorationCellSize{8.0};

    CollisionConfig collision;
    PoissonConfig decoration;
    BiomeConfig biomes;

    /**
     * @brief Override values from a JSON file
     * @return false on unreadable or malformed files (logged, values untouched)
     */
    bool loadFromFile(const std::string& path);

    /**
     * @brief Override values from an already parsed document
     * @details Wrong-typed or out-of-range entries are logged and skipped.
     * @return false if root is not an object
     */
    bool apply(const JsonValue& root);

    /**
     * @throws std::invalid_argument when a value cannot drive the streaming core
     */
    void validate() const;
};

} // namespace RiverForge

#endif // STREAMING_CONFIG_HPP
