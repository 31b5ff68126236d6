/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "decoration/SpatialGrid.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace RiverForge {

SpatialGrid::SpatialGrid(double cellSize) : m_cellSize(cellSize) {
    if (!(cellSize > 0.0)) {
        throw std::invalid_argument("SpatialGrid cell size must be positive, got " +
                                    std::to_string(cellSize));
    }
}

void SpatialGrid::forEachOverlappingCell(double x, double z, double radius,
                                         const std::function<void(CellCoord)>& fn) const {
    const int minX = static_cast<int>(std::floor((x - radius) / m_cellSize));
    const int maxX = static_cast<int>(std::floor((x + radius) / m_cellSize));
    const int minZ = static_cast<int>(std::floor((z - radius) / m_cellSize));
    const int maxZ = static_cast<int>(std::floor((z + radius) / m_cellSize));

    for (int cz = minZ; cz <= maxZ; ++cz) {
        for (int cx = minX; cx <= maxX; ++cx) {
            fn(CellCoord{cx, cz});
        }
    }
}

// Two overlapping disks always share at least one cell, so it is enough to
// visit the cells covered by the query's own radius.
template<typename Pred>
bool SpatialGrid::anyNearby(double x, double z, double radius, Pred&& pred) const {
    bool found = false;
    forEachOverlappingCell(x, z, radius, [&](CellCoord c) {
        if (found) return;
        auto it = m_cells.find(c);
        if (it == m_cells.end()) return;

        for (size_t index : it->second) {
            const GridItem& item = m_items[index];
            const double dx = item.x - x;
            const double dz = item.z - z;
            if (pred(item, dx * dx + dz * dz)) {
                found = true;
                return;
            }
        }
    });
    return found;
}

void SpatialGrid::insert(const DecorationPlacement& placement) {
    const size_t index = m_items.size();
    m_items.push_back(GridItem{placement.x, placement.z, placement.groundRadius,
                               placement.canopyRadius, placement.speciesRadius,
                               placement.speciesId});

    forEachOverlappingCell(placement.x, placement.z, placement.maxRadius(),
                           [&](CellCoord c) {
        auto& cell = m_cells[c];
        if (cell.capacity() == 0) {
            cell.reserve(4);
        }
        cell.push_back(index);
    });
}

bool SpatialGrid::checkCollision(double x, double z, double groundRadius,
                                 double canopyRadius, double speciesRadius,
                                 const std::string& speciesId) const {
    const double searchRadius = std::max(groundRadius, std::max(canopyRadius, speciesRadius));

    return anyNearby(x, z, searchRadius, [&](const GridItem& item, double distSq) {
        const double ground = groundRadius + item.groundRadius;
        if (distSq < ground * ground) {
            return true;
        }

        if (canopyRadius > 0.0 && item.canopyRadius > 0.0) {
            const double canopy = canopyRadius + item.canopyRadius;
            if (distSq < canopy * canopy) {
                return true;
            }
        }

        if (speciesRadius > 0.0 && item.speciesRadius > 0.0 &&
            item.speciesId == speciesId) {
            const double species = speciesRadius + item.speciesRadius;
            if (distSq < species * species) {
                return true;
            }
        }
        return false;
    });
}

bool SpatialGrid::checkGroundCollision(double x, double z, double groundRadius) const {
    return anyNearby(x, z, groundRadius, [&](const GridItem& item, double distSq) {
        const double ground = groundRadius + item.groundRadius;
        return distSq < ground * ground;
    });
}

void SpatialGrid::clear() {
    m_items.clear();
    m_cells.clear();
}

} // namespace RiverForge
