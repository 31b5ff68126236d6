/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_CORRIDOR_HPP
#define COLLISION_CORRIDOR_HPP

#include "interfaces/IPhysicsWorld.hpp"
#include "interfaces/IRenderer.hpp"
#include "interfaces/TerrainSampler.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <utility>

namespace RiverForge {

struct CollisionConfig {
    double radius{300.0};      // half-length of the corridor around the observer
    double step{5.0};          // z length of one bank segment
    double updateStep{50.0};   // window start is quantised to this
};

// Left and right bank edges covering [zStart, zEnd)
struct CollisionSegment {
    double zStart{0.0};
    double zEnd{0.0};
    BodyHandle leftBody{INVALID_BODY};
    BodyHandle rightBody{INVALID_BODY};
    MeshHandle leftDebugLine{INVALID_MESH};
    MeshHandle rightDebugLine{INVALID_MESH};
};

/**
 * @brief Sliding window of static river bank edges around the observer
 *
 * Segments are cached by their start z. When the quantised window moves,
 * only keys that entered the window are built and only keys that left it
 * are destroyed. If the physics world refuses a body mid-update, the
 * segments built so far are kept and the window start is not committed,
 * so the next update picks up where this one stopped.
 */
class CollisionCorridor {
public:
    /**
     * @param physics world receiving the bank bodies
     * @param river centre and width source
     * @param config corridor geometry
     * @param renderer optional, only needed for debug lines
     * @throws std::invalid_argument on non-positive radius, step or updateStep
     */
    CollisionCorridor(IPhysicsWorld& physics, const RiverProfile& river,
                      const CollisionConfig& config = CollisionConfig{},
                      IRenderer* renderer = nullptr);
    ~CollisionCorridor();

    CollisionCorridor(const CollisionCorridor&) = delete;
    CollisionCorridor& operator=(const CollisionCorridor&) = delete;

    void update(double observerZ);

    // Destroys every body and debug line and forgets the window
    void clear();

    /**
     * @brief Toggle one debug line per bank edge
     * @details Ignored with a warning when no renderer was supplied.
     */
    void setDebug(bool enabled);
    bool isDebug() const { return m_debug; }

    size_t getSegmentCount() const { return m_segments.size(); }
    const std::map<double, CollisionSegment>& getSegments() const { return m_segments; }
    std::optional<double> getWindowStart() const { return m_windowStart; }
    std::optional<double> getWindowEnd() const { return m_windowEnd; }
    const CollisionConfig& getConfig() const { return m_config; }

    // Window [start, end) an update at observerZ would cover
    std::pair<double, double> computeWindow(double observerZ) const;

private:
    IPhysicsWorld& m_physics;
    const RiverProfile& m_river;
    CollisionConfig m_config;
    IRenderer* m_renderer;
    bool m_debug{false};

    std::map<double, CollisionSegment> m_segments;
    std::optional<double> m_windowStart;
    std::optional<double> m_windowEnd;

    std::optional<CollisionSegment> createSegment(double zStart, double zEnd);
    BodyHandle createBank(double zStart, double zEnd, bool leftBank);
    void createDebugLines(CollisionSegment& segment);
    void destroyDebugLines(CollisionSegment& segment);
    void destroySegment(CollisionSegment& segment);
    double bankX(double z, bool leftBank) const;
};

} // namespace RiverForge

#endif // COLLISION_CORRIDOR_HPP
