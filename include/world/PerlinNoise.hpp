/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PERLIN_NOISE_HPP
#define PERLIN_NOISE_HPP

#include <vector>

namespace RiverForge {

/**
 * @brief Seeded 2D gradient noise
 *
 * Returns values in roughly [-1, 1]. The permutation table is shuffled once
 * at construction, so instances with the same seed produce the same field.
 */
class PerlinNoise {
public:
    explicit PerlinNoise(unsigned int seed);

    double noise(double x, double y) const;

private:
    std::vector<int> m_permutation;

    static double fade(double t);
    static double lerp(double t, double a, double b);
    static double grad(int hash, double x, double y);
};

} // namespace RiverForge

#endif // PERLIN_NOISE_HPP
