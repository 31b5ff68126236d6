/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TERRAIN_CHUNK_HPP
#define TERRAIN_CHUNK_HPP

#include "core/StreamingConfig.hpp"
#include "decoration/DecorationContext.hpp"
#include "decoration/SpatialGrid.hpp"
#include "interfaces/IAssetLoader.hpp"
#include "interfaces/IRenderer.hpp"
#include "managers/BiomeManager.hpp"
#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace RiverForge {

class DecorationCatalog;
class IEntityManager;
class PoissonDecorationStrategy;
class RiverProfile;
class TerrainSampler;

/**
 * @brief Collaborators a chunk builds against
 *
 * Everything is owned elsewhere (by TerrainManager or the application) and
 * outlives the chunk.
 */
struct ChunkServices {
    BiomeManager& biomes;
    const RiverProfile& river;
    const TerrainSampler& sampler;
    IRenderer& renderer;
    IEntityManager& entities;
    IAssetLoader& assets;
    const DecorationCatalog& catalog;
    const PoissonDecorationStrategy& poisson;
};

enum class ConstructionState {
    Requested,
    Stepping,
    WaitingOnAsset,
    Complete,
    Failed
};

inline std::ostream& operator<<(std::ostream& os, ConstructionState state) {
    switch (state) {
        case ConstructionState::Requested: return os << "Requested";
        case ConstructionState::Stepping: return os << "Stepping";
        case ConstructionState::WaitingOnAsset: return os << "WaitingOnAsset";
        case ConstructionState::Complete: return os << "Complete";
        case ConstructionState::Failed: return os << "Failed";
    }
    return os << "Unknown";
}

/**
 * @brief One z slice of the river valley, built incrementally
 *
 * Construction is a resumable state machine. Every step() performs one
 * bounded unit of work:
 *  - a batch of ground mesh rows, then the ground mesh submission
 *  - the water plane
 *  - decoration planning, one biome segment per step
 *  - asset requests (may park the chunk in WaitingOnAsset)
 *  - instancing
 *  - scene submission and entity spawning
 *
 * The chunk owns every renderer handle it creates; dispose() releases them.
 */
class TerrainChunk {
public:
    TerrainChunk(int index, const StreamingConfig& config, ChunkServices services);
    ~TerrainChunk();

    TerrainChunk(const TerrainChunk&) = delete;
    TerrainChunk& operator=(const TerrainChunk&) = delete;

    /**
     * @brief Perform one unit of construction work
     * @return state after the step; Complete and Failed are terminal
     */
    ConstructionState step();

    /**
     * @brief Re-poll outstanding asset handles
     * @return WaitingOnAsset while any handle is pending, Stepping once all
     *         are ready, Failed if one failed
     */
    ConstructionState pollAssets();

    // Per-frame tick of an active chunk
    void update(double deltaTime);

    void setVisible(bool visible);
    bool isVisible() const { return m_visible; }

    // Removes and destroys every renderer handle. Safe to call repeatedly.
    void dispose();
    bool isDisposed() const { return m_disposed; }

    int getIndex() const { return m_index; }
    double getZOffset() const { return m_zOffset; }
    double getZEnd() const { return m_zOffset + m_config.chunkSize; }
    ConstructionState getState() const { return m_state; }

    const std::vector<DecorationPlacement>& getPlacements() const { return m_placements; }
    const std::map<std::string, size_t>& getDecorationCounts() const { return m_speciesCounts; }

    MeshHandle getGroundMesh() const { return m_groundMesh; }
    MeshHandle getWaterMesh() const { return m_waterMesh; }
    const std::vector<MeshHandle>& getDecorationMeshes() const { return m_decorationMeshes; }
    size_t getSpawnedEntityCount() const { return m_spawnedEntities; }
    double getElapsedTime() const { return m_elapsedTime; }

private:
    enum class Phase {
        GroundRows,
        GroundSubmit,
        Water,
        Decorations,
        Assets,
        Instancing,
        Submit,
        Done
    };

    int m_index;
    double m_zOffset;
    const StreamingConfig& m_config;
    ChunkServices m_services;

    ConstructionState m_state{ConstructionState::Requested};
    Phase m_phase{Phase::GroundRows};

    MeshData m_groundData;
    int m_nextRow{0};
    std::vector<FeatureSegment> m_segments;
    size_t m_nextSegment{0};
    bool m_segmentsPlanned{false};
    std::vector<AssetHandle> m_pendingAssets;
    SpatialGrid m_grid;   // shared by every segment and rule of the chunk

    std::vector<DecorationPlacement> m_placements;
    std::map<std::string, size_t> m_speciesCounts;

    MeshHandle m_groundMesh{INVALID_MESH};
    MeshHandle m_waterMesh{INVALID_MESH};
    std::vector<MeshHandle> m_decorationMeshes;
    bool m_inScene{false};
    bool m_visible{true};
    bool m_disposed{false};
    size_t m_spawnedEntities{0};
    double m_elapsedTime{0.0};

    void buildGroundRows();
    void submitGround();
    void buildWater();
    void planDecorations();
    void requestAssets();
    void buildInstances();
    void submitToScene();

    ConstructionState fail(const std::string& reason);
    double rowZ(int row) const;
};

} // namespace RiverForge

#endif // TERRAIN_CHUNK_HPP
