/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/PerlinNoise.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace RiverForge {

PerlinNoise::PerlinNoise(unsigned int seed) {
  m_permutation.resize(256);
  std::iota(m_permutation.begin(), m_permutation.end(), 0);

  std::mt19937 engine(seed);
  std::shuffle(m_permutation.begin(), m_permutation.end(), engine);

  // Duplicate so lookups at X + 1 never wrap
  m_permutation.insert(m_permutation.end(), m_permutation.begin(),
                       m_permutation.begin() + 256);
}

double PerlinNoise::fade(double t) {
  return t * t * t * (t * (t * 6 - 15) + 10);
}

double PerlinNoise::lerp(double t, double a, double b) {
  return a + t * (b - a);
}

double PerlinNoise::grad(int hash, double x, double y) {
  int h = hash & 15;
  double u = h < 8 ? x : y;
  double v = h < 4 ? y : (h == 12 || h == 14) ? x : 0.0;
  return ((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v);
}

double PerlinNoise::noise(double x, double y) const {
  const double fx = std::floor(x);
  const double fy = std::floor(y);
  int X = static_cast<int>(static_cast<long long>(fx) & 255);
  int Y = static_cast<int>(static_cast<long long>(fy) & 255);

  x -= fx;
  y -= fy;

  double u = fade(x);
  double v = fade(y);

  int A = m_permutation[X] + Y;
  int AA = m_permutation[A];
  int AB = m_permutation[A + 1];
  int B = m_permutation[X + 1] + Y;
  int BA = m_permutation[B];
  int BB = m_permutation[B + 1];

  return lerp(v,
              lerp(u, grad(m_permutation[AA], x, y),
                   grad(m_permutation[BA], x - 1, y)),
              lerp(u, grad(m_permutation[AB], x, y - 1),
                   grad(m_permutation[BB], x - 1, y - 1)));
}

} // namespace RiverForge
