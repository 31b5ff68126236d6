/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/BiomeManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace RiverForge {

BiomeManager::BiomeGenerator::BiomeGenerator(uint32_t seed,
                                             std::optional<BiomeType> fixedBiome)
    : m_rng(seed), m_fixedBiome(fixedBiome) {}

BiomeType BiomeManager::BiomeGenerator::draw() {
  if (m_fixedBiome) {
    return *m_fixedBiome;
  }

  // Refill as: type1, happy, type2, happy, ... and pop from the back, so
  // every round starts with a happy biome
  if (m_deck.empty()) {
    std::array<BiomeType, DECK_BIOME_TYPES.size()> shuffled = DECK_BIOME_TYPES;
    std::shuffle(shuffled.begin(), shuffled.end(), m_rng);
    for (BiomeType type : shuffled) {
      m_deck.push_back(type);
      m_deck.push_back(BiomeType::HAPPY);
    }
  }

  BiomeType type = m_deck.back();
  m_deck.pop_back();
  return type;
}

BiomeInstance BiomeManager::BiomeGenerator::next(double z, int direction) {
  const BiomeType type = draw();
  const BiomeFeatures &features = getBiomeFeatures(type);
  const int ordinal = m_ordinals[static_cast<size_t>(type)]++;

  if (direction > 0) {
    return BiomeInstance{type, ordinal, z, z + features.length, &features};
  }
  return BiomeInstance{type, ordinal, z - features.length, z, &features};
}

BiomeManager::BiomeManager(const BiomeConfig &config)
    : m_positiveGenerator(config.seed, config.fixedBiome),
      m_negativeGenerator(config.seed ^ 0x9E3779B9u, config.fixedBiome),
      m_halfWidth(config.transitionWidth / 2.0) {
  if (config.transitionWidth < 0.0) {
    throw std::invalid_argument("BiomeManager transition width must not be negative");
  }
}

void BiomeManager::ensureWindow(double zMin, double zMax) {
  if (zMin > zMax) {
    throw std::invalid_argument("BiomeManager::ensureWindow: zMin " +
                                std::to_string(zMin) + " > zMax " +
                                std::to_string(zMax));
  }

  const double lo = zMin - m_halfWidth;
  const double hi = zMax + m_halfWidth;

  if (m_instances.empty()) {
    m_instances.push_back(m_positiveGenerator.next(0.0, 1));
  }

  while (m_instances.back().zMax <= hi) {
    const BiomeInstance instance =
        m_positiveGenerator.next(m_instances.back().zMax, 1);
    BIOME_DEBUG("Appended " + biomeTypeToString(instance.type) + " [" +
                std::to_string(instance.zMin) + ", " +
                std::to_string(instance.zMax) + ")");
    m_instances.push_back(instance);
  }

  while (m_instances.front().zMin > lo) {
    const BiomeInstance instance =
        m_negativeGenerator.next(m_instances.front().zMin, -1);
    BIOME_DEBUG("Prepended " + biomeTypeToString(instance.type) + " [" +
                std::to_string(instance.zMin) + ", " +
                std::to_string(instance.zMax) + ")");
    m_instances.push_front(instance);
  }
}

void BiomeManager::pruneWindow(double zMin, double zMax) {
  size_t pruned = 0;
  while (m_instances.size() > 1 && m_instances.front().zMax <= zMin) {
    m_instances.pop_front();
    ++pruned;
  }
  while (m_instances.size() > 1 && m_instances.back().zMin > zMax) {
    m_instances.pop_back();
    ++pruned;
  }

  if (pruned > 0) {
    BIOME_DEBUG("Pruned " + std::to_string(pruned) + " biome instances outside [" +
                std::to_string(zMin) + ", " + std::to_string(zMax) + "]");
  }
}

bool BiomeManager::isCovered(double z) const {
  return !m_instances.empty() && m_instances.front().zMin <= z &&
         z < m_instances.back().zMax;
}

std::optional<BiomeBoundaries> BiomeManager::getCoveredRange() const {
  if (m_instances.empty()) {
    return std::nullopt;
  }
  return BiomeBoundaries{m_instances.front().zMin, m_instances.back().zMax};
}

size_t BiomeManager::findInstanceIndex(double z) const {
  if (!isCovered(z)) {
    const std::string window =
        m_instances.empty()
            ? std::string("empty")
            : "[" + std::to_string(m_instances.front().zMin) + ", " +
                  std::to_string(m_instances.back().zMax) + ")";
    throw std::out_of_range("BiomeManager: z " + std::to_string(z) +
                            " is outside the generated window " + window);
  }

  // First instance starting after z, the home interval is the one before it
  auto it = std::upper_bound(
      m_instances.begin(), m_instances.end(), z,
      [](double value, const BiomeInstance &instance) {
        return value < instance.zMin;
      });
  return static_cast<size_t>(std::distance(m_instances.begin(), it)) - 1;
}

const BiomeInstance &BiomeManager::getBiomeInstanceAt(double z) const {
  return m_instances[findInstanceIndex(z)];
}

BiomeBoundaries BiomeManager::getBiomeBoundaries(double z) const {
  const BiomeInstance &instance = getBiomeInstanceAt(z);
  return BiomeBoundaries{instance.zMin, instance.zMax};
}

BiomeMixture BiomeManager::getBiomeMixture(double z) const {
  const size_t index = findInstanceIndex(z);
  const BiomeInstance &home = m_instances[index];

  BiomeMixture mixture;

  const double distFromMin = z - home.zMin;
  const double distFromMax = home.zMax - z;
  const bool nearMin = distFromMin <= distFromMax;
  const double d = nearMin ? distFromMin : distFromMax;

  const BiomeInstance *neighbour = nullptr;
  if (nearMin && index > 0) {
    neighbour = &m_instances[index - 1];
  } else if (!nearMin && index + 1 < m_instances.size()) {
    neighbour = &m_instances[index + 1];
  }

  if (neighbour == nullptr || d >= m_halfWidth) {
    mixture.push_back(BiomeWeight{home.type, 1.0, home.features});
    return mixture;
  }

  const double homeWeight = 0.5 + 0.5 * (d / m_halfWidth);
  mixture.push_back(BiomeWeight{home.type, homeWeight, home.features});
  mixture.push_back(
      BiomeWeight{neighbour->type, 1.0 - homeWeight, neighbour->features});
  return mixture;
}

template <typename Getter>
double BiomeManager::blend(double z, Getter getter) const {
  double value = 0.0;
  for (const BiomeWeight &entry : getBiomeMixture(z)) {
    value += getter(*entry.features) * entry.weight;
  }
  return value;
}

double BiomeManager::getBiomeFogDensity(double z) const {
  return blend(z, [](const BiomeFeatures &f) { return f.fogDensity; });
}

FogRange BiomeManager::getBiomeFogRange(double z) const {
  FogRange range{0.0, 0.0};
  for (const BiomeWeight &entry : getBiomeMixture(z)) {
    range.near += entry.features->fogRange.near * entry.weight;
    range.far += entry.features->fogRange.far * entry.weight;
  }
  return range;
}

Color BiomeManager::getBiomeGroundColor(double z) const {
  Color color;
  for (const BiomeWeight &entry : getBiomeMixture(z)) {
    const Color c = Color::fromHex(entry.features->groundColor);
    color.r += c.r * entry.weight;
    color.g += c.g * entry.weight;
    color.b += c.b * entry.weight;
  }
  return color;
}

double BiomeManager::getAmplitudeMultiplier(double z) const {
  return blend(z, [](const BiomeFeatures &f) { return f.amplitudeMultiplier; });
}

double BiomeManager::getRiverWidthMultiplier(double z) const {
  return blend(z, [](const BiomeFeatures &f) { return f.riverWidthMultiplier; });
}

double BiomeManager::getBiomeWeight(double z, BiomeType type) const {
  double weight = 0.0;
  for (const BiomeWeight &entry : getBiomeMixture(z)) {
    if (entry.biome == type) {
      weight += entry.weight;
    }
  }
  return weight;
}

double BiomeManager::getBiomeProgress(double z) const {
  const BiomeInstance &instance = getBiomeInstanceAt(z);
  return (z - instance.zMin) / (instance.zMax - instance.zMin);
}

std::vector<FeatureSegment> BiomeManager::getFeatureSegments(double zMin,
                                                             double zMax) const {
  std::vector<FeatureSegment> segments;
  const int direction = zMax < zMin ? -1 : 1;
  double currentZ = zMin;

  while (direction == 1 ? currentZ < zMax : currentZ > zMax) {
    // Walking down, the point just below currentZ selects the next interval
    const double sampleZ =
        direction == 1
            ? currentZ
            : std::nextafter(currentZ, -std::numeric_limits<double>::infinity());
    const BiomeInstance &instance = getBiomeInstanceAt(sampleZ);
    const double segmentEnd = direction == 1 ? std::min(zMax, instance.zMax)
                                             : std::max(zMax, instance.zMin);

    segments.push_back(FeatureSegment{instance.type, instance.features, currentZ,
                                      segmentEnd, instance.zMin, instance.zMax});
    currentZ = segmentEnd;
  }

  return segments;
}

} // namespace RiverForge
