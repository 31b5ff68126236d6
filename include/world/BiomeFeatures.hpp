/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BIOME_FEATURES_HPP
#define BIOME_FEATURES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace RiverForge {

enum class BiomeType : uint8_t {
    HAPPY,
    FOREST,
    DESERT,
    ICE,
    SWAMP,
    JURASSIC
};

constexpr size_t BIOME_TYPE_COUNT = 6;

// Stream operators for test output
inline std::ostream& operator<<(std::ostream& os, const BiomeType& biome) {
    switch (biome) {
        case BiomeType::HAPPY: return os << "HAPPY";
        case BiomeType::FOREST: return os << "FOREST";
        case BiomeType::DESERT: return os << "DESERT";
        case BiomeType::ICE: return os << "ICE";
        case BiomeType::SWAMP: return os << "SWAMP";
        case BiomeType::JURASSIC: return os << "JURASSIC";
        default: return os << "UNKNOWN";
    }
}

struct Color {
    double r{0.0};
    double g{0.0};
    double b{0.0};

    static Color fromHex(uint32_t hex) {
        return Color{((hex >> 16) & 0xFF) / 255.0, ((hex >> 8) & 0xFF) / 255.0,
                     (hex & 0xFF) / 255.0};
    }
};

struct FogRange {
    double near{100.0};
    double far{800.0};
};

/**
 * @brief Static generation parameters of one biome type
 */
struct BiomeFeatures {
    BiomeType type;
    const char* name;
    double length;                 // extent along z of one instance
    double fogDensity;
    FogRange fogRange;
    uint32_t groundColor;
    double riverWidthMultiplier;
    double amplitudeMultiplier;
};

/**
 * @brief Catalog entry for a biome type
 */
const BiomeFeatures& getBiomeFeatures(BiomeType type);

// Lowercase names as used in configuration files ("happy", "swamp", ...)
std::string biomeTypeToString(BiomeType type);
std::optional<BiomeType> biomeTypeFromString(const std::string& name);

// Types drawn between happy biomes
constexpr std::array<BiomeType, 5> DECK_BIOME_TYPES = {
    BiomeType::DESERT, BiomeType::FOREST, BiomeType::ICE,
    BiomeType::SWAMP, BiomeType::JURASSIC};

} // namespace RiverForge

#endif // BIOME_FEATURES_HPP
