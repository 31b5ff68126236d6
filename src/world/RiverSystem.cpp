/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/RiverSystem.hpp"
#include "managers/BiomeManager.hpp"
#include <algorithm>

namespace RiverForge {

RiverSystem::RiverSystem(const BiomeManager &biomeManager, unsigned int seed)
    : m_biomeManager(biomeManager), m_noise(seed) {}

double RiverSystem::getRiverCenter(double z) const {
  return m_noise.noise(0.0, z * PATH_SCALE) * PATH_AMPLITUDE;
}

double RiverSystem::getRiverWidth(double z) const {
  // Wide or narrow section, normalized to [0, 1]
  const double section = (m_noise.noise(100.0, z * WIDTH_SCALE) + 1.0) / 2.0;
  const double baseWidth = MIN_WIDTH + (MAX_WIDTH - MIN_WIDTH) * section;
  return std::max(MIN_WIDTH,
                  baseWidth * m_biomeManager.getRiverWidthMultiplier(z));
}

double RiverSystem::getRiverDerivative(double z) const {
  constexpr double epsilon = 1.0;
  return (getRiverCenter(z + epsilon) - getRiverCenter(z - epsilon)) /
         (2.0 * epsilon);
}

double RiverSystem::getDistanceToWater(const Vector2D &start,
                                       const Vector2D &direction) const {
  constexpr double stepSize = 1.0;
  constexpr int maxSteps = 200;
  constexpr double buffer = 0.5;

  Vector2D position = start;
  double travelled = 0.0;

  for (int i = 0; i < maxSteps; ++i) {
    const double z = position.getY();
    if (position.getX() > getLeftBank(z) + buffer &&
        position.getX() < getRightBank(z) - buffer) {
      return travelled;
    }
    position = position + direction * stepSize;
    travelled += stepSize;
  }

  return -1.0;
}

} // namespace RiverForge
