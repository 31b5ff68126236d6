/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TERRAIN_MANAGER_HPP
#define TERRAIN_MANAGER_HPP

#include "collisions/CollisionCorridor.hpp"
#include "core/StreamingConfig.hpp"
#include "decoration/PoissonDecorationStrategy.hpp"
#include "utils/Vector2D.hpp"
#include "world/PerlinNoise.hpp"
#include "world/TerrainChunk.hpp"
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace RiverForge {

class BiomeManager;
class DecorationCatalog;
class IAssetLoader;
class IEntityManager;
class IPhysicsWorld;
class IRenderer;
class RiverProfile;
class TerrainSampler;

/**
 * @brief Streams terrain chunks along the river around a moving observer
 *
 * update() decides which chunks should exist and evicts the rest;
 * generate() spends a wall-clock budget advancing chunk construction.
 * Both are meant to be called once per frame from the main thread.
 */
class TerrainManager {
public:
    /**
     * @throws std::invalid_argument if the config fails validation
     */
    TerrainManager(BiomeManager& biomes, const RiverProfile& river,
                   const TerrainSampler& sampler, IPhysicsWorld& physics,
                   IRenderer& renderer, IEntityManager& entities,
                   IAssetLoader& assets, const DecorationCatalog& catalog,
                   const StreamingConfig& config = StreamingConfig{});
    ~TerrainManager();

    TerrainManager(const TerrainManager&) = delete;
    TerrainManager& operator=(const TerrainManager&) = delete;

    /**
     * @brief Recompute the chunk window around observerZ
     *
     * Extends the biome window, starts missing chunks (at most
     * maxConcurrentLoads at a time, nearest first, alternating sides),
     * evicts chunks outside the window and cleans up their entities, then
     * ticks active chunks and moves the collision corridor.
     * @param observerZ observer position along the river
     * @param deltaTime frame time in seconds
     */
    void update(double observerZ, double deltaTime);

    /**
     * @brief Advance loading chunks round-robin until the budget runs out
     * @param budgetMs wall-clock budget in milliseconds
     * @return number of construction steps performed
     */
    size_t generate(double budgetMs);

    /**
     * @brief Queue a chunk to be destroyed and rebuilt
     * @details Queued indices are processed one per update, only while no
     * chunk is loading.
     */
    void requestChunkRegeneration(int index);

    // Rebuild every active chunk, highest index first. Designer mode only.
    void regenerateDesignerTerrain();

    /**
     * @brief Show chunks near or in front of the camera, hide the rest
     * @param cameraPosition camera (x, z)
     * @param cameraDirection view direction on the (x, z) plane
     */
    void updateVisibility(const Vector2D& cameraPosition, const Vector2D& cameraDirection);

    // Per-species decoration counts summed over active chunks
    std::map<std::string, size_t> getDecorationStats() const;

    bool isChunkActive(int index) const { return m_activeChunks.count(index) != 0; }
    bool isChunkLoading(int index) const { return m_loadingChunks.count(index) != 0; }
    bool isChunkBlacklisted(int index) const;
    std::vector<int> getActiveChunkIndices() const;
    std::vector<int> getLoadingChunkIndices() const;
    size_t getActiveChunkCount() const { return m_activeChunks.size(); }
    size_t getLoadingChunkCount() const { return m_loadingChunks.size(); }
    const TerrainChunk* getChunk(int index) const;

    int getWindowMin() const { return m_windowMin; }
    int getWindowMax() const { return m_windowMax; }
    int getCurrentIndex() const { return m_currentIndex; }
    size_t getRegenerationQueueSize() const { return m_regenerationQueue.size(); }

    CollisionCorridor& getCollisionCorridor() { return m_collision; }
    const CollisionCorridor& getCollisionCorridor() const { return m_collision; }

    void setDebug(bool enabled);
    bool isDebug() const { return m_debug; }

    const StreamingConfig& getConfig() const { return m_config; }

private:
    using ChunkMap = std::map<int, std::unique_ptr<TerrainChunk>>;

    StreamingConfig m_config;
    BiomeManager& m_biomes;
    const RiverProfile& m_river;
    IEntityManager& m_entities;

    PerlinNoise m_decorationNoise;
    PoissonDecorationStrategy m_poisson;
    ChunkServices m_services;
    CollisionCorridor m_collision;

    ChunkMap m_activeChunks;
    ChunkMap m_loadingChunks;
    std::deque<int> m_regenerationQueue;
    std::map<int, int> m_failureCounts;

    int m_currentIndex{0};
    int m_windowMin{0};
    int m_windowMax{0};
    bool m_debug{false};

    void computeWindow(double observerZ);
    void startMissingChunks();
    bool startChunk(int index);
    size_t evictChunks();
    void cleanupAfterEviction(double observerZ);
    std::pair<double, double> corridorBiomeRange(double observerZ) const;
    void onChunkFailed(int index);
};

} // namespace RiverForge

#endif // TERRAIN_MANAGER_HPP
