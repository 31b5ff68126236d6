/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/TerrainGeometry.hpp"
#include "managers/BiomeManager.hpp"
#include <algorithm>
#include <cmath>

namespace RiverForge {

namespace {

double smoothstep(double edge0, double edge1, double x) {
  const double t = std::clamp((x - edge0) / (edge1 - edge0), 0.0, 1.0);
  return t * t * (3.0 - 2.0 * t);
}

} // namespace

TerrainGeometry::TerrainGeometry(const RiverProfile &river,
                                 const BiomeManager &biomeManager,
                                 unsigned int seed)
    : m_river(river), m_biomeManager(biomeManager), m_noise(seed) {}

double TerrainGeometry::rawLandHeight(double x, double z) const {
  // Low frequency mask picks hills or mountains, biased towards hills
  double mountainMask = (m_noise.noise(x * 0.001, z * 0.001) + 1.0) / 2.0;
  mountainMask *= mountainMask;

  const double hills = m_noise.noise(x * 0.01, z * 0.01) * 5.0 +
                       m_noise.noise(x * 0.03, z * 0.03) * 2.0;

  const double ridge1 = 1.0 - std::abs(m_noise.noise(x * 0.005, z * 0.005));
  const double ridge2 = 1.0 - std::abs(m_noise.noise(x * 0.01, z * 0.01));
  const double mountains = ridge1 * ridge1 * 40.0 + ridge2 * ridge2 * 10.0;

  double height = hills * (1.0 - mountainMask) + mountains * mountainMask;
  height += m_noise.noise(x * 0.1, z * 0.1);

  // Keep land above water level so no inland lakes form
  height = std::max(MIN_LAND_HEIGHT, height + MIN_LAND_HEIGHT);
  return height * m_biomeManager.getAmplitudeMultiplier(z);
}

double TerrainGeometry::rawRiverHeight(double distFromCenter, double riverEdge) {
  const double normalized = std::min(1.0, distFromCenter / riverEdge);
  return -RIVER_DEPTH * (1.0 - normalized * normalized);
}

double TerrainGeometry::calculateHeight(double x, double z) const {
  const double riverEdge = m_river.getRiverWidth(z) / 2.0;
  const double distFromCenter = std::abs(x - m_river.getRiverCenter(z));

  const double mix = smoothstep(riverEdge - BANK_TRANSITION / 2.0,
                                riverEdge + BANK_TRANSITION / 2.0,
                                distFromCenter);
  if (mix <= 0.0) {
    return rawRiverHeight(distFromCenter, riverEdge);
  }
  return (1.0 - mix) * rawRiverHeight(distFromCenter, riverEdge) +
         mix * rawLandHeight(x, z);
}

Normal3D TerrainGeometry::calculateNormal(double x, double z) const {
  const double riverEdge = m_river.getRiverWidth(z) / 2.0;
  const double distFromCenter = std::abs(x - m_river.getRiverCenter(z));
  if (distFromCenter < riverEdge) {
    return Normal3D{};
  }

  constexpr double epsilon = 0.1;
  const double hL = rawLandHeight(x - epsilon, z);
  const double hR = rawLandHeight(x + epsilon, z);
  const double hD = rawLandHeight(x, z - epsilon);
  const double hU = rawLandHeight(x, z + epsilon);

  // cross((0, hU - hD, 2e), (2e, hR - hL, 0))
  Normal3D n{-(hR - hL) * 2.0 * epsilon, 4.0 * epsilon * epsilon,
             -(hU - hD) * 2.0 * epsilon};
  const double length = std::sqrt(n.x * n.x + n.y * n.y + n.z * n.z);
  n.x /= length;
  n.y /= length;
  n.z /= length;
  return n;
}

bool TerrainGeometry::isPointInRiver(double x, double z) const {
  return std::abs(x - m_river.getRiverCenter(z)) < m_river.getRiverWidth(z) / 2.0;
}

bool TerrainGeometry::checkVisibility(double targetX, double targetHeight,
                                      double z, int steps) const {
  const double startX = m_river.getRiverCenter(z);
  constexpr double startY = 2.0;

  for (int i = 1; i < steps; ++i) {
    const double t = static_cast<double>(i) / steps;
    const double checkX = startX + (targetX - startX) * t;
    const double checkY = startY + (targetHeight - startY) * t;

    if (calculateHeight(checkX, z) > checkY + 0.5) {
      return false;
    }
  }
  return true;
}

TerrainSample TerrainGeometry::sampleTerrain(double x, double z) const {
  const Normal3D normal = calculateNormal(x, z);
  TerrainSample sample;
  sample.height = calculateHeight(x, z);
  sample.slope = std::acos(std::clamp(normal.y, -1.0, 1.0));
  sample.distanceToRiver = std::abs(x - m_river.getRiverCenter(z)) -
                           m_river.getRiverWidth(z) / 2.0;
  return sample;
}

double TerrainGeometry::sampleBiomeProgress(double z) const {
  return m_biomeManager.getBiomeProgress(z);
}

bool TerrainGeometry::isVisibleFromRiver(double x, double height, double z) const {
  return checkVisibility(x, height, z);
}

} // namespace RiverForge
