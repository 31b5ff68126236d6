/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/TerrainManager.hpp"
#include "core/Logger.hpp"
#include "interfaces/IEntityManager.hpp"
#include "interfaces/TerrainSampler.hpp"
#include "managers/BiomeManager.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <optional>
#include <utility>

namespace RiverForge {

namespace {

// Corners further behind the camera plane than this are not visible
constexpr double BEHIND_CAMERA_TOLERANCE = -20.0;

const StreamingConfig& validated(const StreamingConfig& config) {
    config.validate();
    return config;
}

} // namespace

TerrainManager::TerrainManager(BiomeManager& biomes, const RiverProfile& river,
                               const TerrainSampler& sampler, IPhysicsWorld& physics,
                               IRenderer& renderer, IEntityManager& entities,
                               IAssetLoader& assets, const DecorationCatalog& catalog,
                               const StreamingConfig& config)
    : m_config(validated(config)),
      m_biomes(biomes),
      m_river(river),
      m_entities(entities),
      m_decorationNoise(config.worldSeed),
      m_poisson(m_decorationNoise, config.decoration),
      m_services{biomes, river, sampler, renderer, entities, assets, catalog, m_poisson},
      m_collision(physics, river, config.collision, &renderer) {
    TERRAIN_INFO("TerrainManager initialized: chunkSize " + std::to_string(m_config.chunkSize) +
                 ", renderDistance " + std::to_string(m_config.renderDistance) +
                 (m_config.designerMode ? ", designer mode" : ""));
}

TerrainManager::~TerrainManager() {
    for (auto& [index, chunk] : m_loadingChunks) {
        (void)index;
        chunk->dispose();
    }
    for (auto& [index, chunk] : m_activeChunks) {
        (void)index;
        chunk->dispose();
    }
    m_loadingChunks.clear();
    m_activeChunks.clear();
}

void TerrainManager::computeWindow(double observerZ) {
    const double chunkSize = m_config.chunkSize;
    m_currentIndex = static_cast<int>(std::floor(observerZ / chunkSize));

    if (m_config.designerMode) {
        // Pinned to the first biome behind the origin plus one chunk either side
        m_biomes.ensureWindow(-1.0, 0.0);
        const BiomeBoundaries first = m_biomes.getBiomeBoundaries(-1.0);
        m_windowMin = static_cast<int>(std::floor(first.zMin / chunkSize)) - 1;
        m_windowMax = 1;
    } else {
        m_windowMin = m_currentIndex - m_config.renderDistance;
        m_windowMax = m_currentIndex + m_config.renderDistance;
    }
}

bool TerrainManager::isChunkBlacklisted(int index) const {
    auto it = m_failureCounts.find(index);
    return it != m_failureCounts.end() && it->second > m_config.maxConstructionRetries;
}

bool TerrainManager::startChunk(int index) {
    if (isChunkActive(index) || isChunkLoading(index) || isChunkBlacklisted(index)) {
        return false;
    }
    m_loadingChunks.emplace(index, std::make_unique<TerrainChunk>(index, m_config, m_services));
    TERRAIN_DEBUG("Requested chunk " + std::to_string(index));
    return true;
}

void TerrainManager::startMissingChunks() {
    const size_t maxLoads = m_config.maxConcurrentLoads;
    const int from = std::clamp(m_currentIndex, m_windowMin, m_windowMax);

    // Outward from the observer, alternating sides, -z side first on ties
    for (int offset = 0; m_loadingChunks.size() < maxLoads; ++offset) {
        const int below = from - offset;
        const int above = from + offset;
        if (below < m_windowMin && above > m_windowMax) {
            break;
        }
        if (below >= m_windowMin) {
            startChunk(below);
        }
        if (offset > 0 && above <= m_windowMax && m_loadingChunks.size() < maxLoads) {
            startChunk(above);
        }
    }
}

size_t TerrainManager::evictChunks() {
    std::optional<int> regenerate;
    if (m_loadingChunks.empty() && !m_regenerationQueue.empty()) {
        regenerate = m_regenerationQueue.front();
        m_regenerationQueue.pop_front();
    }

    size_t removed = 0;
    for (auto it = m_activeChunks.begin(); it != m_activeChunks.end();) {
        const int index = it->first;
        const bool outside = index < m_windowMin - 1 || index > m_windowMax + 1;
        if (outside || (regenerate && *regenerate == index)) {
            it->second->dispose();
            it = m_activeChunks.erase(it);
            ++removed;
            TERRAIN_DEBUG("Evicted chunk " + std::to_string(index) +
                          (outside ? "" : " for regeneration"));
        } else {
            ++it;
        }
    }
    return removed;
}

void TerrainManager::cleanupAfterEviction(double observerZ) {
    std::vector<int> indices;
    indices.reserve(m_activeChunks.size() + m_loadingChunks.size());
    for (const auto& entry : m_activeChunks) {
        indices.push_back(entry.first);
    }
    for (const auto& entry : m_loadingChunks) {
        indices.push_back(entry.first);
    }
    if (indices.empty()) {
        return;
    }
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    const double chunkSize = m_config.chunkSize;
    const double margin = m_config.cleanupMargin;
    const double firstZ = indices.front() * chunkSize;
    const double lastZ = (indices.back() + 1) * chunkSize;

    m_entities.removeEntitiesInRange(firstZ - margin, firstZ);
    m_entities.removeEntitiesInRange(lastZ, lastZ + margin);

    // Holes left inside the window (e.g. a chunk being regenerated)
    for (size_t i = 1; i < indices.size(); ++i) {
        if (indices[i] - indices[i - 1] > 1) {
            m_entities.removeEntitiesInRange((indices[i - 1] + 1) * chunkSize,
                                             indices[i] * chunkSize);
        }
    }

    // Keep every biome the padded chunk window or the collision corridor can
    // still sample
    const auto [corridorMin, corridorMax] = corridorBiomeRange(observerZ);
    const double halfWidth = m_biomes.getHalfTransitionWidth();
    const double keepMin = std::min({firstZ, (m_windowMin - 1) * chunkSize, corridorMin});
    const double keepMax = std::max({lastZ, (m_windowMax + 2) * chunkSize, corridorMax});
    m_biomes.pruneWindow(keepMin - halfWidth, keepMax + halfWidth);
}

std::pair<double, double> TerrainManager::corridorBiomeRange(double observerZ) const {
    // Bank edges read one step past either end of each segment
    const auto [start, end] = m_collision.computeWindow(observerZ);
    const double margin = 2.0 * m_collision.getConfig().step;
    return {start - margin, end + margin};
}

void TerrainManager::update(double observerZ, double deltaTime) {
    computeWindow(observerZ);

    const double chunkSize = m_config.chunkSize;
    m_biomes.ensureWindow(m_windowMin * chunkSize, (m_windowMax + 1) * chunkSize);

    // Failures only block an index while it stays in the window
    for (auto it = m_failureCounts.begin(); it != m_failureCounts.end();) {
        if (it->first < m_windowMin || it->first > m_windowMax) {
            it = m_failureCounts.erase(it);
        } else {
            ++it;
        }
    }

    startMissingChunks();

    if (evictChunks() > 0) {
        cleanupAfterEviction(observerZ);
    }

    for (auto& [index, chunk] : m_activeChunks) {
        (void)index;
        chunk->update(deltaTime);
    }

    // The corridor samples river width, which reads biome data
    const auto [corridorMin, corridorMax] = corridorBiomeRange(observerZ);
    m_biomes.ensureWindow(corridorMin, corridorMax);
    m_collision.update(observerZ);
}

void TerrainManager::onChunkFailed(int index) {
    const int failures = ++m_failureCounts[index];
    if (failures > m_config.maxConstructionRetries) {
        TERRAIN_WARN("Chunk " + std::to_string(index) + " failed " + std::to_string(failures) +
                     " times, not retrying while it stays in the window");
    } else {
        TERRAIN_WARN("Chunk " + std::to_string(index) + " failed, retry " +
                     std::to_string(failures) + " of " +
                     std::to_string(m_config.maxConstructionRetries));
    }
}

size_t TerrainManager::generate(double budgetMs) {
    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    auto budgetExhausted = [&]() {
        const std::chrono::duration<double, std::milli> elapsed = Clock::now() - start;
        return elapsed.count() >= budgetMs;
    };

    size_t steps = 0;
    while (!m_loadingChunks.empty()) {
        bool stepped = false;

        for (auto it = m_loadingChunks.begin(); it != m_loadingChunks.end();) {
            if (budgetExhausted()) {
                return steps;
            }

            const int index = it->first;
            TerrainChunk& chunk = *it->second;

            ConstructionState state = chunk.getState();
            if (state == ConstructionState::WaitingOnAsset) {
                state = chunk.pollAssets();
                if (state == ConstructionState::WaitingOnAsset) {
                    ++it;
                    continue;
                }
            }
            if (state != ConstructionState::Failed) {
                state = chunk.step();
                ++steps;
                stepped = true;
            }

            if (state == ConstructionState::Complete) {
                m_failureCounts.erase(index);
                TERRAIN_DEBUG("Chunk " + std::to_string(index) + " complete");
                m_activeChunks[index] = std::move(it->second);
                it = m_loadingChunks.erase(it);
            } else if (state == ConstructionState::Failed) {
                it->second->dispose();
                it = m_loadingChunks.erase(it);
                onChunkFailed(index);
            } else {
                ++it;
            }
        }

        if (!stepped) {
            break;  // everything left is waiting on assets
        }
    }
    return steps;
}

void TerrainManager::requestChunkRegeneration(int index) {
    if (std::find(m_regenerationQueue.begin(), m_regenerationQueue.end(), index) ==
        m_regenerationQueue.end()) {
        m_regenerationQueue.push_back(index);
    }
}

void TerrainManager::regenerateDesignerTerrain() {
    if (!m_config.designerMode) {
        TERRAIN_WARN("regenerateDesignerTerrain ignored outside designer mode");
        return;
    }
    for (auto it = m_activeChunks.rbegin(); it != m_activeChunks.rend(); ++it) {
        requestChunkRegeneration(it->first);
    }
}

void TerrainManager::updateVisibility(const Vector2D& cameraPosition,
                                      const Vector2D& cameraDirection) {
    const double maxDistance = m_config.visibilityRadius + m_config.chunkSize;
    const double cameraZ = cameraPosition.getY();
    const double halfWidth = m_config.chunkWidth / 2.0;

    for (auto& [index, chunk] : m_activeChunks) {
        (void)index;
        if (m_config.designerMode) {
            chunk->setVisible(true);
            continue;
        }

        const double z0 = chunk->getZOffset();
        const double z1 = chunk->getZEnd();
        if (cameraZ >= z0 && cameraZ < z1) {
            chunk->setVisible(true);
            continue;
        }

        // Chunk footprint: chunkWidth across, centred on the river at each end
        const double c0 = m_river.getRiverCenter(z0);
        const double c1 = m_river.getRiverCenter(z1);
        const std::array<Vector2D, 4> corners = {
            Vector2D(c0 - halfWidth, z0), Vector2D(c0 + halfWidth, z0),
            Vector2D(c1 - halfWidth, z1), Vector2D(c1 + halfWidth, z1)};

        bool visible = false;
        for (const Vector2D& corner : corners) {
            const Vector2D toCorner = corner - cameraPosition;
            if (toCorner.length() <= maxDistance &&
                toCorner.dot(cameraDirection) > BEHIND_CAMERA_TOLERANCE) {
                visible = true;
                break;
            }
        }
        chunk->setVisible(visible);
    }
}

std::map<std::string, size_t> TerrainManager::getDecorationStats() const {
    std::map<std::string, size_t> stats;
    for (const auto& [index, chunk] : m_activeChunks) {
        (void)index;
        for (const auto& [species, count] : chunk->getDecorationCounts()) {
            stats[species] += count;
        }
    }
    return stats;
}

std::vector<int> TerrainManager::getActiveChunkIndices() const {
    std::vector<int> indices;
    indices.reserve(m_activeChunks.size());
    for (const auto& entry : m_activeChunks) {
        indices.push_back(entry.first);
    }
    return indices;
}

std::vector<int> TerrainManager::getLoadingChunkIndices() const {
    std::vector<int> indices;
    indices.reserve(m_loadingChunks.size());
    for (const auto& entry : m_loadingChunks) {
        indices.push_back(entry.first);
    }
    return indices;
}

const TerrainChunk* TerrainManager::getChunk(int index) const {
    if (auto it = m_activeChunks.find(index); it != m_activeChunks.end()) {
        return it->second.get();
    }
    if (auto it = m_loadingChunks.find(index); it != m_loadingChunks.end()) {
        return it->second.get();
    }
    return nullptr;
}

void TerrainManager::setDebug(bool enabled) {
    m_debug = enabled;
    m_collision.setDebug(enabled);
    TERRAIN_INFO(std::string("Debug overlay ") + (enabled ? "enabled" : "disabled"));
}

} // namespace RiverForge
