/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/BiomeFeatures.hpp"

namespace RiverForge {

namespace {

// Indexed by BiomeType
const std::array<BiomeFeatures, BIOME_TYPE_COUNT> BIOME_CATALOG = {{
    {BiomeType::HAPPY, "happy", 600.0, 0.0, {100.0, 800.0}, 0x33aa33, 1.0, 0.5},
    {BiomeType::FOREST, "forest", 2000.0, 0.0, {100.0, 800.0}, 0x115511, 1.0, 1.0},
    {BiomeType::DESERT, "desert", 2000.0, 0.0, {100.0, 800.0}, 0xCC8822, 1.0, 1.0},
    {BiomeType::ICE, "ice", 1000.0, 0.9, {0.0, 400.0}, 0xEEFFFF, 2.3, 1.0},
    {BiomeType::SWAMP, "swamp", 1600.0, 0.9, {0.0, 300.0}, 0x2B241C, 5.0, 0.1},
    {BiomeType::JURASSIC, "jurassic", 2000.0, 0.3, {50.0, 600.0}, 0x2E4B2E, 1.7, 1.0},
}};

} // namespace

const BiomeFeatures& getBiomeFeatures(BiomeType type) {
    return BIOME_CATALOG[static_cast<size_t>(type)];
}

std::string biomeTypeToString(BiomeType type) {
    return getBiomeFeatures(type).name;
}

std::optional<BiomeType> biomeTypeFromString(const std::string& name) {
    for (const auto& features : BIOME_CATALOG) {
        if (name == features.name) {
            return features.type;
        }
    }
    return std::nullopt;
}

} // namespace RiverForge
