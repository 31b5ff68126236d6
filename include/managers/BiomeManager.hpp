/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BIOME_MANAGER_HPP
#define BIOME_MANAGER_HPP

#include "world/BiomeFeatures.hpp"
#include <boost/container/small_vector.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <optional>
#include <random>
#include <vector>

namespace RiverForge {

/**
 * @brief One generated biome interval [zMin, zMax)
 */
struct BiomeInstance {
    BiomeType type;
    int ordinal;        // how many instances of this type the generator made before
    double zMin;
    double zMax;
    const BiomeFeatures* features;

    bool contains(double z) const { return zMin <= z && z < zMax; }
};

struct BiomeWeight {
    BiomeType biome;
    double weight;
    const BiomeFeatures* features;
};

// Home biome first, optional neighbour second
using BiomeMixture = boost::container::small_vector<BiomeWeight, 2>;

struct BiomeBoundaries {
    double zMin;
    double zMax;
};

/**
 * @brief Part of a z range that lies inside a single biome interval
 */
struct FeatureSegment {
    BiomeType type;
    const BiomeFeatures* features;
    double zMin;
    double zMax;
    double biomeZMin;
    double biomeZMax;
};

struct BiomeConfig {
    uint32_t seed{1337};
    std::optional<BiomeType> fixedBiome;   // designer override for every draw
    double transitionWidth{50.0};
};

/**
 * @brief Lazily extended, contiguous sequence of biome intervals along z
 *
 * The manager is owned by the application and passed by reference to
 * everything that samples biome data. Intervals are only appended at either
 * end (ensureWindow) or dropped from either end (pruneWindow). Queries
 * outside the generated range are programmer errors and throw
 * std::out_of_range.
 */
class BiomeManager {
public:
    explicit BiomeManager(const BiomeConfig& config = BiomeConfig{});

    BiomeManager(const BiomeManager&) = delete;
    BiomeManager& operator=(const BiomeManager&) = delete;

    /**
     * @brief Extend the sequence so that [zMin, zMax] is covered
     *
     * Coverage is padded by half the transition width on both sides so that
     * every z in the window has its blend neighbour. Idempotent.
     * @throws std::invalid_argument if zMin > zMax
     */
    void ensureWindow(double zMin, double zMax);

    /**
     * @brief Drop intervals lying entirely outside [zMin, zMax]
     */
    void pruneWindow(double zMin, double zMax);

    /**
     * @brief Bounds of the home interval containing z
     * @throws std::out_of_range if z is not covered
     */
    BiomeBoundaries getBiomeBoundaries(double z) const;

    const BiomeInstance& getBiomeInstanceAt(double z) const;

    /**
     * @brief One or two biome weights summing to 1.0
     *
     * Within half the transition width of a boundary the home biome weight
     * falls linearly from 1.0 to 0.5 at the boundary itself.
     */
    BiomeMixture getBiomeMixture(double z) const;

    // Mixture-weighted biome properties
    double getBiomeFogDensity(double z) const;
    FogRange getBiomeFogRange(double z) const;
    Color getBiomeGroundColor(double z) const;
    double getAmplitudeMultiplier(double z) const;
    double getRiverWidthMultiplier(double z) const;

    /**
     * @brief Weight of a given biome type at z (0 if not part of the mixture)
     */
    double getBiomeWeight(double z, BiomeType type) const;

    /**
     * @brief Relative position of z inside its home interval, in [0, 1)
     */
    double getBiomeProgress(double z) const;

    /**
     * @brief Split [zMin, zMax) into per-interval segments
     *
     * A descending range (zMin > zMax) is walked towards -z and yields
     * segments in that order.
     */
    std::vector<FeatureSegment> getFeatureSegments(double zMin, double zMax) const;

    bool isCovered(double z) const;

    // [first.zMin, last.zMax) of the generated sequence, nullopt when empty
    std::optional<BiomeBoundaries> getCoveredRange() const;
    size_t getInstanceCount() const { return m_instances.size(); }
    const std::deque<BiomeInstance>& getInstances() const { return m_instances; }
    double getHalfTransitionWidth() const { return m_halfWidth; }

private:
    // Shuffled deck of biome types per traversal direction
    class BiomeGenerator {
    public:
        BiomeGenerator(uint32_t seed, std::optional<BiomeType> fixedBiome);

        BiomeInstance next(double z, int direction);

    private:
        BiomeType draw();

        std::mt19937 m_rng;
        std::optional<BiomeType> m_fixedBiome;
        std::vector<BiomeType> m_deck;
        std::array<int, BIOME_TYPE_COUNT> m_ordinals{};
    };

    std::deque<BiomeInstance> m_instances;
    BiomeGenerator m_positiveGenerator;
    BiomeGenerator m_negativeGenerator;
    double m_halfWidth;

    size_t findInstanceIndex(double z) const;
    template <typename Getter>
    double blend(double z, Getter getter) const;
};

} // namespace RiverForge

#endif // BIOME_MANAGER_HPP
