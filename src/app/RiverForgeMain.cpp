/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/FramePacer.hpp"
#include "core/Logger.hpp"
#include "core/StreamingConfig.hpp"
#include "decoration/DecorationCatalog.hpp"
#include "interfaces/IAssetLoader.hpp"
#include "interfaces/IEntityManager.hpp"
#include "interfaces/IPhysicsWorld.hpp"
#include "interfaces/IRenderer.hpp"
#include "managers/BiomeManager.hpp"
#include "managers/TerrainManager.hpp"
#include "world/RiverSystem.hpp"
#include "world/TerrainGeometry.hpp"
#include <cstdlib>
#include <exception>
#include <map>
#include <set>
#include <string>

using namespace RiverForge;

namespace {

const std::string CONFIG_PATH{"res/data/streaming.json"};
const double TARGET_FPS{60.0};
const double OBSERVER_SPEED{-40.0};   // units per second, downstream is -z
const int DEFAULT_FRAMES{1800};

// Renderer that only hands out and tracks handles
class HeadlessRenderer : public IRenderer {
public:
    MeshHandle createMesh(MeshData&& data) override {
        m_vertices += data.vertexCount();
        return track();
    }

    MeshHandle createInstanceBatch(InstanceBatch&& batch) override {
        m_instances += batch.instances.size();
        return track();
    }

    MeshHandle createDebugLine(const Vector2D&, const Vector2D&) override { return track(); }

    void destroyMesh(MeshHandle mesh) override {
        m_live.erase(mesh);
        m_scene.erase(mesh);
    }

    void addToScene(MeshHandle mesh) override { m_scene.insert(mesh); }
    void removeFromScene(MeshHandle mesh) override { m_scene.erase(mesh); }
    void setVisible(MeshHandle, bool) override {}

    size_t getLiveCount() const { return m_live.size(); }
    size_t getSceneCount() const { return m_scene.size(); }
    size_t getTotalVertices() const { return m_vertices; }
    size_t getTotalInstances() const { return m_instances; }

private:
    MeshHandle track() {
        const MeshHandle handle = m_next++;
        m_live.insert(handle);
        return handle;
    }

    MeshHandle m_next{1};
    std::set<MeshHandle> m_live;
    std::set<MeshHandle> m_scene;
    size_t m_vertices{0};
    size_t m_instances{0};
};

// Static bodies only, nothing is simulated
class HeadlessPhysicsWorld : public IPhysicsWorld {
public:
    BodyHandle createStaticBody() override {
        ++m_bodies;
        return m_next++;
    }

    void destroyBody(BodyHandle) override { --m_bodies; }

    bool createEdgeFixture(BodyHandle, const EdgeShape&, const FixtureDef&) override {
        return true;
    }

    std::vector<BodyHandle> queryAABB(const Vector2D&, const Vector2D&) const override {
        return {};
    }

    std::optional<double> rayCast(const Vector2D&, const Vector2D&) const override {
        return std::nullopt;
    }

    size_t getBodyCount() const { return m_bodies; }

private:
    BodyHandle m_next{1};
    size_t m_bodies{0};
};

class HeadlessEntityManager : public IEntityManager {
public:
    EntityID add(const EntitySpawn& spawn) override {
        const EntityID id = m_next++;
        m_entities[id] = spawn.z;
        return id;
    }

    void remove(EntityID entity) override { m_entities.erase(entity); }

    void removeEntitiesInRange(double zMin, double zMax) override {
        for (auto it = m_entities.begin(); it != m_entities.end();) {
            if (it->second >= zMin && it->second < zMax) {
                it = m_entities.erase(it);
            } else {
                ++it;
            }
        }
    }

    size_t getEntityCount() const { return m_entities.size(); }

private:
    EntityID m_next{1};
    std::map<EntityID, double> m_entities;
};

// Every asset is resident as soon as it is asked for
class InstantAssetLoader : public IAssetLoader {
public:
    AssetHandle ensureLoaded(const std::string&) override { return AssetHandle::ready(); }
};

} // namespace

// maybe_unused is just a hint to the compiler that the variable is not used.
// with -Wall -Wextra flags
[[maybe_unused]] int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    const std::string configPath = argc > 1 ? argv[1] : CONFIG_PATH;
    const int frames = argc > 2 ? std::atoi(argv[2]) : DEFAULT_FRAMES;

    StreamingConfig config;
    if (!config.loadFromFile(configPath)) {
        DEMO_WARN("Using built-in streaming defaults");
    }

    try {
        HeadlessRenderer renderer;
        HeadlessPhysicsWorld physics;
        HeadlessEntityManager entities;
        InstantAssetLoader assets;

        BiomeManager biomes(config.biomes);
        RiverSystem river(biomes, config.worldSeed);
        TerrainGeometry terrain(river, biomes, config.worldSeed + 1);
        DecorationCatalog catalog;
        TerrainManager terrainManager(biomes, river, terrain, physics, renderer, entities,
                                      assets, catalog, config);

        FramePacer pacer(TARGET_FPS);
        double observerZ = 0.0;

        DEMO_INFO("Streaming " + std::to_string(frames) + " frames from " + configPath);

        for (int frame = 0; frame < frames; ++frame) {
            pacer.startFrame();

            const double dt = pacer.getDeltaTime();
            observerZ += OBSERVER_SPEED * dt;

            terrainManager.update(observerZ, dt);
            const Vector2D camera(river.getRiverCenter(observerZ), observerZ);
            terrainManager.updateVisibility(camera, Vector2D(0.0, -1.0));
            terrainManager.generate(pacer.getGenerationBudgetMs());

            if (pacer.isFrameTimeExcessive()) {
                DEMO_WARN("Frame " + std::to_string(frame) + " ran over budget");
            }
            if (frame % static_cast<int>(TARGET_FPS) == 0) {
                DEMO_INFO("z " + std::to_string(observerZ) + ": " +
                          std::to_string(terrainManager.getActiveChunkCount()) + " active, " +
                          std::to_string(terrainManager.getLoadingChunkCount()) + " loading, " +
                          std::to_string(physics.getBodyCount()) + " bodies, " +
                          std::to_string(entities.getEntityCount()) + " entities, " +
                          std::to_string(pacer.getCurrentFPS()) + " fps");
            }

            pacer.endFrame();
        }

        for (const auto& [species, count] : terrainManager.getDecorationStats()) {
            DEMO_INFO(species + ": " + std::to_string(count));
        }
        DEMO_INFO("Renderer holds " + std::to_string(renderer.getLiveCount()) + " meshes, " +
                  std::to_string(renderer.getSceneCount()) + " in scene, " +
                  std::to_string(renderer.getTotalVertices()) + " vertices and " +
                  std::to_string(renderer.getTotalInstances()) + " instances built");
    } catch (const std::exception& e) {
        DEMO_CRITICAL(std::string("Streaming demo aborted: ") + e.what());
        return -1;
    }

    return 0;
}
