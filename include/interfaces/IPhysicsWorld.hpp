/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IPHYSICS_WORLD_HPP
#define IPHYSICS_WORLD_HPP

/**
 * @file IPhysicsWorld.hpp
 * @brief Call-level contract of the 2D physics engine consumed by the
 *        streaming core. The physics plane is (x, z): world z maps to the
 *        physics y axis.
 */

#include "utils/Vector2D.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace RiverForge {

using BodyHandle = uint32_t;
constexpr BodyHandle INVALID_BODY = 0;

namespace CollisionCategory {
constexpr uint16_t TERRAIN = 0x0001;
constexpr uint16_t PLAYER = 0x0002;
constexpr uint16_t OBSTACLE = 0x0004;
constexpr uint16_t ALL = 0xFFFF;
} // namespace CollisionCategory

/**
 * @brief Two-sided edge with optional ghost vertices
 *
 * prev/next are the neighbouring chain vertices. They never collide, they
 * only give the solver the tangent on either side of the edge.
 */
struct EdgeShape {
    Vector2D v1;
    Vector2D v2;
    std::optional<Vector2D> prev;
    std::optional<Vector2D> next;
};

struct FixtureDef {
    double friction{0.0};
    double restitution{0.0};
    uint16_t categoryBits{CollisionCategory::TERRAIN};
    uint16_t maskBits{CollisionCategory::ALL};
};

class IPhysicsWorld {
public:
    virtual ~IPhysicsWorld() = default;

    /**
     * @brief Create a static body
     * @return INVALID_BODY when the world is locked mid-step
     */
    virtual BodyHandle createStaticBody() = 0;

    virtual void destroyBody(BodyHandle body) = 0;

    /**
     * @brief Attach an edge fixture to a body
     * @return false if the fixture could not be created
     */
    virtual bool createEdgeFixture(BodyHandle body, const EdgeShape& shape,
                                   const FixtureDef& def) = 0;

    virtual std::vector<BodyHandle> queryAABB(const Vector2D& min,
                                              const Vector2D& max) const = 0;

    /**
     * @brief Nearest hit along the segment
     * @return hit fraction in [0, 1], or nullopt when nothing is hit
     */
    virtual std::optional<double> rayCast(const Vector2D& from,
                                          const Vector2D& to) const = 0;
};

} // namespace RiverForge

#endif // IPHYSICS_WORLD_HPP
