/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IRENDERER_HPP
#define IRENDERER_HPP

/**
 * @file IRenderer.hpp
 * @brief Rendering backend contract. The core only creates, submits and
 *        destroys resources through these entry points.
 */

#include "utils/Vector2D.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace RiverForge {

using MeshHandle = uint32_t;
constexpr MeshHandle INVALID_MESH = 0;

// Interleaved-free vertex streams: positions and colors are xyz / rgb triples
struct MeshData {
    std::string name;
    std::string materialId;
    std::vector<float> positions;
    std::vector<float> colors;
    std::vector<uint32_t> indices;

    size_t vertexCount() const { return positions.size() / 3; }
};

struct InstanceTransform {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
    float scale{1.0f};
    float rotation{0.0f};
    uint32_t color{0xFFFFFF};
};

// All instances of one material merged into a single draw
struct InstanceBatch {
    std::string name;
    std::string materialId;
    std::vector<std::string> assetIds;
    std::vector<InstanceTransform> instances;
};

class IRenderer {
public:
    virtual ~IRenderer() = default;

    virtual MeshHandle createMesh(MeshData&& data) = 0;
    virtual MeshHandle createInstanceBatch(InstanceBatch&& batch) = 0;
    virtual MeshHandle createDebugLine(const Vector2D& from, const Vector2D& to) = 0;
    virtual void destroyMesh(MeshHandle mesh) = 0;

    virtual void addToScene(MeshHandle mesh) = 0;
    virtual void removeFromScene(MeshHandle mesh) = 0;
    virtual void setVisible(MeshHandle mesh, bool visible) = 0;
};

} // namespace RiverForge

#endif // IRENDERER_HPP
