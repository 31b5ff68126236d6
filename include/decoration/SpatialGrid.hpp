/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_GRID_HPP
#define SPATIAL_GRID_HPP

#include "decoration/DecorationContext.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace RiverForge {

/**
 * @brief Uniform grid over the x/z plane for decoration spacing checks
 *
 * Each placement is registered in every cell its largest radius overlaps.
 * Three radius classes are tested independently:
 *  - ground: always, any two placements
 *  - canopy: only when both canopy radii are positive
 *  - species: only between placements of the same species
 */
class SpatialGrid {
public:
    explicit SpatialGrid(double cellSize);

    void insert(const DecorationPlacement& placement);

    bool checkCollision(double x, double z, double groundRadius,
                        double canopyRadius, double speciesRadius,
                        const std::string& speciesId) const;

    bool checkGroundCollision(double x, double z, double groundRadius) const;

    size_t size() const { return m_items.size(); }
    bool empty() const { return m_items.empty(); }
    void clear();

    double getCellSize() const { return m_cellSize; }

private:
    struct CellCoord { int x; int z; };
    struct CellCoordHash {
        size_t operator()(const CellCoord& c) const noexcept {
            return (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) ^
                   static_cast<uint32_t>(c.z);
        }
    };
    struct CellCoordEq {
        bool operator()(const CellCoord& a, const CellCoord& b) const noexcept {
            return a.x == b.x && a.z == b.z;
        }
    };

    struct GridItem {
        double x;
        double z;
        double groundRadius;
        double canopyRadius;
        double speciesRadius;
        std::string speciesId;
    };

    using CellVector = std::vector<size_t>;

    double m_cellSize;
    std::vector<GridItem> m_items;
    std::unordered_map<CellCoord, CellVector, CellCoordHash, CellCoordEq> m_cells;

    void forEachOverlappingCell(double x, double z, double radius,
                                const std::function<void(CellCoord)>& fn) const;

    template<typename Pred>
    bool anyNearby(double x, double z, double radius, Pred&& pred) const;
};

} // namespace RiverForge

#endif // SPATIAL_GRID_HPP
