/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DECORATION_CATALOG_HPP
#define DECORATION_CATALOG_HPP

#include "decoration/DecorationRule.hpp"
#include "decoration/Fitness.hpp"
#include "world/BiomeFeatures.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace RiverForge {

struct SpeciesMetadata {
    std::string id;
    std::string assetId;
    std::string materialId;
    double groundRadius{1.0};
    double canopyRadius{0.0};
    double speciesSpacing{0.0};
    double minScale{1.0};
    double maxScale{1.0};
    std::vector<uint32_t> palette{0xFFFFFF};
    bool spawnsEntity{false};
};

/**
 * @brief Species driven by metadata and a preference fitness
 *
 * Radii scale with the drawn instance scale. Subclasses decide how the
 * scale is drawn and which radius classes apply.
 */
class CatalogSpecies : public Species {
public:
    CatalogSpecies(SpeciesMetadata metadata, FitnessPtr preference);

    const std::string& id() const override { return m_metadata.id; }
    double preference(const DecorationContext& ctx) const override;
    std::optional<PlacementParams> generate(const DecorationContext& ctx) const override;

    const SpeciesMetadata& getMetadata() const { return m_metadata; }

protected:
    virtual double drawScale(const DecorationContext& ctx) const;
    virtual void shape(PlacementParams& params, double scale) const;

    uint32_t drawColor(const DecorationContext& ctx) const;

    SpeciesMetadata m_metadata;
    FitnessPtr m_preference;
};

class TreeSpecies : public CatalogSpecies {
public:
    using CatalogSpecies::CatalogSpecies;

protected:
    void shape(PlacementParams& params, double scale) const override;
};

// Rocks skew small; big boulders are rare
class RockSpecies : public CatalogSpecies {
public:
    using CatalogSpecies::CatalogSpecies;

protected:
    double drawScale(const DecorationContext& ctx) const override;
    void shape(PlacementParams& params, double scale) const override;
};

class ShrubSpecies : public CatalogSpecies {
public:
    using CatalogSpecies::CatalogSpecies;

protected:
    void shape(PlacementParams& params, double scale) const override;
};

/**
 * @brief Per-biome ordered rule lists
 *
 * Rule order is placement order: large tiers first so smaller ground cover
 * fills the remaining space.
 */
class DecorationCatalog {
public:
    DecorationCatalog();

    const DecorationRuleList& getRules(BiomeType type) const;

private:
    std::array<DecorationRuleList, BIOME_TYPE_COUNT> m_rules;
};

} // namespace RiverForge

#endif // DECORATION_CATALOG_HPP
