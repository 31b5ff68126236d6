/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/TerrainChunk.hpp"
#include "core/Logger.hpp"
#include "decoration/DecorationCatalog.hpp"
#include "decoration/PoissonDecorationStrategy.hpp"
#include "decoration/SpatialGrid.hpp"
#include "interfaces/IEntityManager.hpp"
#include "interfaces/TerrainSampler.hpp"
#include <algorithm>
#include <set>

namespace RiverForge {

namespace {

constexpr double WATER_LEVEL = 0.0;
constexpr double WATER_BANK_OVERLAP = 2.0;
constexpr double VISIBILITY_TARGET_HEIGHT = 2.0;
constexpr uint32_t WATER_COLOR = 0x3A7CA5;
constexpr uint32_t SWAMP_WATER_COLOR = 0x4A5A2A;

uint32_t decorationSeed(uint32_t worldSeed, int index, size_t segment) {
    uint32_t h = worldSeed;
    h ^= static_cast<uint32_t>(index) * 0x9E3779B1u;
    h = (h ^ (h >> 16)) * 0x85EBCA6Bu;
    h ^= static_cast<uint32_t>(segment + 1) * 0xC2B2AE35u;
    h ^= h >> 13;
    return h;
}

void pushColor(std::vector<float>& colors, const Color& color) {
    colors.push_back(static_cast<float>(color.r));
    colors.push_back(static_cast<float>(color.g));
    colors.push_back(static_cast<float>(color.b));
}

Color mixColor(const Color& a, const Color& b, double t) {
    return Color{a.r + (b.r - a.r) * t, a.g + (b.g - a.g) * t, a.b + (b.b - a.b) * t};
}

} // namespace

TerrainChunk::TerrainChunk(int index, const StreamingConfig& config, ChunkServices services)
    : m_index(index),
      m_zOffset(static_cast<double>(index) * config.chunkSize),
      m_config(config),
      m_services(services),
      m_grid(config.decorationCellSize) {
    m_groundData.name = "ground_" + std::to_string(index);
    m_groundData.materialId = "ground";
}

TerrainChunk::~TerrainChunk() {
    dispose();
}

double TerrainChunk::rowZ(int row) const {
    return m_zOffset + m_config.chunkSize * static_cast<double>(row) / m_config.resolutionZ;
}

ConstructionState TerrainChunk::fail(const std::string& reason) {
    CHUNK_ERROR("Chunk " + std::to_string(m_index) + " failed: " + reason);
    m_state = ConstructionState::Failed;
    m_phase = Phase::Done;
    return m_state;
}

ConstructionState TerrainChunk::step() {
    if (m_disposed) {
        return m_state;
    }

    switch (m_state) {
        case ConstructionState::Complete:
        case ConstructionState::Failed:
            return m_state;
        case ConstructionState::WaitingOnAsset:
            return pollAssets();
        case ConstructionState::Requested:
            m_state = ConstructionState::Stepping;
            break;
        case ConstructionState::Stepping:
            break;
    }

    switch (m_phase) {
        case Phase::GroundRows:
            buildGroundRows();
            break;
        case Phase::GroundSubmit:
            submitGround();
            break;
        case Phase::Water:
            buildWater();
            break;
        case Phase::Decorations:
            planDecorations();
            break;
        case Phase::Assets:
            requestAssets();
            break;
        case Phase::Instancing:
            buildInstances();
            break;
        case Phase::Submit:
            submitToScene();
            break;
        case Phase::Done:
            break;
    }
    return m_state;
}

void TerrainChunk::buildGroundRows() {
    const int columns = m_config.resolutionX + 1;
    const int rows = m_config.resolutionZ + 1;
    const int lastRow = std::min(rows, m_nextRow + m_config.meshRowsPerStep);
    const double c = m_config.chunkWidth / 4.0;

    if (m_nextRow == 0) {
        m_groundData.positions.reserve(static_cast<size_t>(rows) * columns * 3);
        m_groundData.colors.reserve(static_cast<size_t>(rows) * columns * 3);
    }

    for (int row = m_nextRow; row < lastRow; ++row) {
        const double z = rowZ(row);
        const double center = m_services.river.getRiverCenter(z);
        const Color ground = m_services.biomes.getBiomeGroundColor(z);

        for (int col = 0; col < columns; ++col) {
            // Columns bunch up near the river where the detail is
            const double u = -1.0 + 2.0 * static_cast<double>(col) / m_config.resolutionX;
            const double x = center + c * u * (1.0 + u * u);
            const double height = m_services.sampler.sampleTerrain(x, z).height;

            m_groundData.positions.push_back(static_cast<float>(x));
            m_groundData.positions.push_back(static_cast<float>(height));
            m_groundData.positions.push_back(static_cast<float>(z));
            pushColor(m_groundData.colors, ground);
        }
    }

    m_nextRow = lastRow;
    if (m_nextRow >= rows) {
        m_phase = Phase::GroundSubmit;
    }
}

void TerrainChunk::submitGround() {
    const uint32_t columns = static_cast<uint32_t>(m_config.resolutionX + 1);
    const uint32_t rows = static_cast<uint32_t>(m_config.resolutionZ + 1);

    m_groundData.indices.reserve(static_cast<size_t>(rows - 1) * (columns - 1) * 6);
    for (uint32_t row = 0; row + 1 < rows; ++row) {
        for (uint32_t col = 0; col + 1 < columns; ++col) {
            const uint32_t a = row * columns + col;
            const uint32_t b = a + 1;
            const uint32_t d = a + columns;
            const uint32_t e = d + 1;
            m_groundData.indices.insert(m_groundData.indices.end(), {a, d, b, b, d, e});
        }
    }

    m_groundMesh = m_services.renderer.createMesh(std::move(m_groundData));
    m_groundData = MeshData{};
    if (m_groundMesh == INVALID_MESH) {
        fail("renderer rejected ground mesh");
        return;
    }
    m_phase = Phase::Water;
}

void TerrainChunk::buildWater() {
    MeshData water;
    water.name = "water_" + std::to_string(m_index);
    water.materialId = "water";

    const Color clear = Color::fromHex(WATER_COLOR);
    const Color swamp = Color::fromHex(SWAMP_WATER_COLOR);
    const int rows = m_config.resolutionZ + 1;

    for (int row = 0; row < rows; ++row) {
        const double z = rowZ(row);
        const double center = m_services.river.getRiverCenter(z);
        const double halfWidth = m_services.river.getRiverWidth(z) / 2.0 + WATER_BANK_OVERLAP;
        const Color color = mixColor(clear, swamp,
                                     m_services.biomes.getBiomeWeight(z, BiomeType::SWAMP));

        for (double x : {center - halfWidth, center + halfWidth}) {
            water.positions.push_back(static_cast<float>(x));
            water.positions.push_back(static_cast<float>(WATER_LEVEL));
            water.positions.push_back(static_cast<float>(z));
            pushColor(water.colors, color);
        }
    }

    for (uint32_t row = 0; row + 1 < static_cast<uint32_t>(rows); ++row) {
        const uint32_t a = row * 2;
        water.indices.insert(water.indices.end(), {a, a + 2, a + 1, a + 1, a + 2, a + 3});
    }

    m_waterMesh = m_services.renderer.createMesh(std::move(water));
    if (m_waterMesh == INVALID_MESH) {
        fail("renderer rejected water mesh");
        return;
    }
    m_phase = Phase::Decorations;
}

void TerrainChunk::planDecorations() {
    if (!m_segmentsPlanned) {
        m_segments = m_services.biomes.getFeatureSegments(m_zOffset, getZEnd());
        m_segmentsPlanned = true;
    }

    if (m_nextSegment < m_segments.size()) {
        const FeatureSegment& segment = m_segments[m_nextSegment];
        const double center = m_services.river.getRiverCenter((segment.zMin + segment.zMax) / 2.0);

        Region region;
        region.xMin = center - m_config.chunkWidth / 2.0;
        region.xMax = center + m_config.chunkWidth / 2.0;
        region.zMin = segment.zMin;
        region.zMax = segment.zMax;

        const TerrainSampler& sampler = m_services.sampler;
        std::vector<DecorationPlacement> placed = m_services.poisson.generate(
            m_services.catalog.getRules(segment.type), region, m_grid, sampler,
            [&sampler](double z) { return sampler.sampleBiomeProgress(z); },
            decorationSeed(m_config.worldSeed, m_index, m_nextSegment));

        for (auto& placement : placed) {
            ++m_speciesCounts[placement.speciesId];
            m_placements.push_back(std::move(placement));
        }
        ++m_nextSegment;
    }

    if (m_nextSegment >= m_segments.size()) {
        CHUNK_DEBUG("Chunk " + std::to_string(m_index) + " planned " +
                    std::to_string(m_placements.size()) + " decorations over " +
                    std::to_string(m_segments.size()) + " biome segments");
        m_phase = Phase::Assets;
    }
}

void TerrainChunk::requestAssets() {
    std::set<std::string> assetIds;
    for (const auto& placement : m_placements) {
        if (!placement.options.spawnsEntity && !placement.options.assetId.empty()) {
            assetIds.insert(placement.options.assetId);
        }
    }

    m_pendingAssets.clear();
    for (const auto& assetId : assetIds) {
        AssetHandle handle = m_services.assets.ensureLoaded(assetId);
        switch (handle.state()) {
            case AssetState::Failed:
                fail("asset '" + assetId + "' failed to load");
                return;
            case AssetState::Pending:
                m_pendingAssets.push_back(std::move(handle));
                break;
            case AssetState::Ready:
                break;
        }
    }

    m_phase = Phase::Instancing;
    if (!m_pendingAssets.empty()) {
        CHUNK_DEBUG("Chunk " + std::to_string(m_index) + " waiting on " +
                    std::to_string(m_pendingAssets.size()) + " assets");
        m_state = ConstructionState::WaitingOnAsset;
    }
}

ConstructionState TerrainChunk::pollAssets() {
    if (m_state != ConstructionState::WaitingOnAsset) {
        return m_state;
    }

    bool pending = false;
    for (const auto& handle : m_pendingAssets) {
        const AssetState state = handle.state();
        if (state == AssetState::Failed) {
            m_pendingAssets.clear();
            return fail("asset failed while pending");
        }
        pending = pending || state == AssetState::Pending;
    }

    if (!pending) {
        m_pendingAssets.clear();
        m_state = ConstructionState::Stepping;
    }
    return m_state;
}

void TerrainChunk::buildInstances() {
    std::map<std::string, InstanceBatch> batches;

    for (const auto& placement : m_placements) {
        if (placement.options.spawnsEntity) {
            continue;
        }
        if (!m_services.sampler.isVisibleFromRiver(placement.x,
                                                   placement.y + VISIBILITY_TARGET_HEIGHT,
                                                   placement.z)) {
            continue;
        }

        InstanceBatch& batch = batches[placement.options.materialId];
        if (batch.name.empty()) {
            batch.name = "decorations_" + std::to_string(m_index) + "_" +
                         placement.options.materialId;
            batch.materialId = placement.options.materialId;
        }
        if (std::find(batch.assetIds.begin(), batch.assetIds.end(),
                      placement.options.assetId) == batch.assetIds.end()) {
            batch.assetIds.push_back(placement.options.assetId);
        }

        InstanceTransform transform;
        transform.x = static_cast<float>(placement.x);
        transform.y = static_cast<float>(placement.y);
        transform.z = static_cast<float>(placement.z);
        transform.scale = static_cast<float>(placement.options.scale);
        transform.rotation = static_cast<float>(placement.options.rotation);
        transform.color = placement.options.color;
        batch.instances.push_back(transform);
    }

    for (auto& [material, batch] : batches) {
        const MeshHandle mesh = m_services.renderer.createInstanceBatch(std::move(batch));
        if (mesh == INVALID_MESH) {
            CHUNK_WARN("Renderer rejected decoration batch '" + material + "' of chunk " +
                       std::to_string(m_index));
            continue;
        }
        m_decorationMeshes.push_back(mesh);
    }

    m_phase = Phase::Submit;
}

void TerrainChunk::submitToScene() {
    IRenderer& renderer = m_services.renderer;
    renderer.addToScene(m_groundMesh);
    renderer.addToScene(m_waterMesh);
    for (MeshHandle mesh : m_decorationMeshes) {
        renderer.addToScene(mesh);
    }
    m_inScene = true;

    for (const auto& placement : m_placements) {
        if (!placement.options.spawnsEntity) {
            continue;
        }
        EntitySpawn spawn;
        spawn.kind = placement.options.kind;
        spawn.x = placement.x;
        spawn.y = placement.y;
        spawn.z = placement.z;
        spawn.rotation = placement.options.rotation;
        if (m_services.entities.add(spawn) != INVALID_ENTITY) {
            ++m_spawnedEntities;
        }
    }

    m_phase = Phase::Done;
    m_state = ConstructionState::Complete;
}

void TerrainChunk::update(double deltaTime) {
    m_elapsedTime += deltaTime;
}

void TerrainChunk::setVisible(bool visible) {
    if (visible == m_visible || m_disposed) {
        return;
    }
    m_visible = visible;
    if (!m_inScene) {
        return;
    }

    IRenderer& renderer = m_services.renderer;
    renderer.setVisible(m_groundMesh, visible);
    renderer.setVisible(m_waterMesh, visible);
    for (MeshHandle mesh : m_decorationMeshes) {
        renderer.setVisible(mesh, visible);
    }
}

void TerrainChunk::dispose() {
    if (m_disposed) {
        return;
    }
    m_disposed = true;

    IRenderer& renderer = m_services.renderer;
    auto release = [&](MeshHandle& mesh) {
        if (mesh == INVALID_MESH) {
            return;
        }
        if (m_inScene) {
            renderer.removeFromScene(mesh);
        }
        renderer.destroyMesh(mesh);
        mesh = INVALID_MESH;
    };

    release(m_groundMesh);
    release(m_waterMesh);
    for (MeshHandle& mesh : m_decorationMeshes) {
        release(mesh);
    }
    m_decorationMeshes.clear();
    m_inScene = false;

    m_placements.clear();
    m_placements.shrink_to_fit();
    m_pendingAssets.clear();
    m_segments.clear();
    m_grid.clear();
    m_groundData = MeshData{};
}

} // namespace RiverForge
