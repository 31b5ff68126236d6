/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IENTITY_MANAGER_HPP
#define IENTITY_MANAGER_HPP

#include <cstdint>
#include <string>

namespace RiverForge {

using EntityID = uint64_t;
constexpr EntityID INVALID_ENTITY = 0;

struct EntitySpawn {
    std::string kind;
    double x{0.0};
    double y{0.0};
    double z{0.0};
    double rotation{0.0};
};

/**
 * @brief Owner of dynamic entities (animals, collectables) spawned by chunks
 *
 * Entities may wander away from the chunk that spawned them, so they are
 * cleaned up by z range rather than by chunk.
 */
class IEntityManager {
public:
    virtual ~IEntityManager() = default;

    virtual EntityID add(const EntitySpawn& spawn) = 0;
    virtual void remove(EntityID entity) = 0;

    /**
     * @brief Remove every entity whose z lies in [zMin, zMax)
     */
    virtual void removeEntitiesInRange(double zMin, double zMax) = 0;
};

} // namespace RiverForge

#endif // IENTITY_MANAGER_HPP
