/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionCorridor.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace RiverForge {

CollisionCorridor::CollisionCorridor(IPhysicsWorld& physics, const RiverProfile& river,
                                     const CollisionConfig& config, IRenderer* renderer)
    : m_physics(physics), m_river(river), m_config(config), m_renderer(renderer) {
    if (!(config.radius > 0.0) || !(config.step > 0.0) || !(config.updateStep > 0.0)) {
        throw std::invalid_argument("CollisionConfig requires positive radius, step and updateStep");
    }
}

CollisionCorridor::~CollisionCorridor() {
    clear();
}

std::pair<double, double> CollisionCorridor::computeWindow(double observerZ) const {
    const double u = m_config.updateStep;
    const double startZ = std::floor((observerZ - m_config.radius) / u) * u;
    const double endZ = std::ceil((observerZ + m_config.radius) / u) * u;
    return {startZ, endZ};
}

double CollisionCorridor::bankX(double z, bool leftBank) const {
    return leftBank ? m_river.getLeftBank(z) : m_river.getRightBank(z);
}

BodyHandle CollisionCorridor::createBank(double zStart, double zEnd, bool leftBank) {
    const BodyHandle body = m_physics.createStaticBody();
    if (body == INVALID_BODY) {
        return INVALID_BODY;
    }

    const double zPrev = zStart - m_config.step;
    const double zNext = zEnd + m_config.step;

    EdgeShape shape;
    shape.v1 = Vector2D(bankX(zStart, leftBank), zStart);
    shape.v2 = Vector2D(bankX(zEnd, leftBank), zEnd);
    shape.prev = Vector2D(bankX(zPrev, leftBank), zPrev);
    shape.next = Vector2D(bankX(zNext, leftBank), zNext);

    if (!m_physics.createEdgeFixture(body, shape, FixtureDef{})) {
        COLLISION_ERROR("Edge fixture rejected at z=" + std::to_string(zStart));
        m_physics.destroyBody(body);
        return INVALID_BODY;
    }
    return body;
}

std::optional<CollisionSegment> CollisionCorridor::createSegment(double zStart, double zEnd) {
    CollisionSegment segment;
    segment.zStart = zStart;
    segment.zEnd = zEnd;

    segment.leftBody = createBank(zStart, zEnd, true);
    if (segment.leftBody == INVALID_BODY) {
        return std::nullopt;
    }

    segment.rightBody = createBank(zStart, zEnd, false);
    if (segment.rightBody == INVALID_BODY) {
        m_physics.destroyBody(segment.leftBody);
        return std::nullopt;
    }

    if (m_debug) {
        createDebugLines(segment);
    }
    return segment;
}

void CollisionCorridor::createDebugLines(CollisionSegment& segment) {
    if (!m_renderer) {
        return;
    }
    for (bool left : {true, false}) {
        const Vector2D from(bankX(segment.zStart, left), segment.zStart);
        const Vector2D to(bankX(segment.zEnd, left), segment.zEnd);
        const MeshHandle line = m_renderer->createDebugLine(from, to);
        if (line != INVALID_MESH) {
            m_renderer->addToScene(line);
        }
        (left ? segment.leftDebugLine : segment.rightDebugLine) = line;
    }
}

void CollisionCorridor::destroyDebugLines(CollisionSegment& segment) {
    if (!m_renderer) {
        return;
    }
    for (MeshHandle* line : {&segment.leftDebugLine, &segment.rightDebugLine}) {
        if (*line != INVALID_MESH) {
            m_renderer->removeFromScene(*line);
            m_renderer->destroyMesh(*line);
            *line = INVALID_MESH;
        }
    }
}

void CollisionCorridor::destroySegment(CollisionSegment& segment) {
    destroyDebugLines(segment);
    if (segment.leftBody != INVALID_BODY) {
        m_physics.destroyBody(segment.leftBody);
        segment.leftBody = INVALID_BODY;
    }
    if (segment.rightBody != INVALID_BODY) {
        m_physics.destroyBody(segment.rightBody);
        segment.rightBody = INVALID_BODY;
    }
}

void CollisionCorridor::update(double observerZ) {
    const auto [startZ, endZ] = computeWindow(observerZ);
    if (m_windowStart && *m_windowStart == startZ) {
        return;
    }

    size_t removed = 0;
    for (auto it = m_segments.begin(); it != m_segments.end();) {
        if (it->first < startZ || it->first >= endZ) {
            destroySegment(it->second);
            it = m_segments.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    size_t created = 0;
    bool complete = true;
    for (long long k = 0;; ++k) {
        const double zStart = startZ + static_cast<double>(k) * m_config.step;
        if (zStart >= endZ) {
            break;
        }
        if (m_segments.count(zStart) != 0) {
            continue;
        }

        std::optional<CollisionSegment> segment = createSegment(zStart, zStart + m_config.step);
        if (!segment) {
            complete = false;
            break;
        }
        m_segments.emplace(zStart, *segment);
        ++created;
    }

    if (!complete) {
        COLLISION_ERROR("Physics world refused a static body, corridor [" +
                        std::to_string(startZ) + ", " + std::to_string(endZ) +
                        ") left partial with " + std::to_string(m_segments.size()) +
                        " segments");
        return;
    }

    m_windowStart = startZ;
    m_windowEnd = endZ;
    COLLISION_DEBUG("Corridor moved to [" + std::to_string(startZ) + ", " +
                    std::to_string(endZ) + "): +" + std::to_string(created) +
                    " -" + std::to_string(removed));
}

void CollisionCorridor::clear() {
    for (auto& [key, segment] : m_segments) {
        (void)key;
        destroySegment(segment);
    }
    m_segments.clear();
    m_windowStart.reset();
    m_windowEnd.reset();
}

void CollisionCorridor::setDebug(bool enabled) {
    if (enabled && !m_renderer) {
        COLLISION_WARN("Debug lines requested without a renderer");
        return;
    }
    if (enabled == m_debug) {
        return;
    }
    m_debug = enabled;
    for (auto& [key, segment] : m_segments) {
        (void)key;
        if (enabled) {
            createDebugLines(segment);
        } else {
            destroyDebugLines(segment);
        }
    }
}

} // namespace RiverForge
