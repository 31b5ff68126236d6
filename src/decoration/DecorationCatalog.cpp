/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "decoration/DecorationCatalog.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

namespace RiverForge {

namespace {

constexpr double TWO_PI = 2.0 * 3.14159265358979323846;

SpeciesMetadata tree(const std::string& id, double ground, double canopy,
                     double minScale, double maxScale, std::vector<uint32_t> palette) {
    SpeciesMetadata m;
    m.id = id;
    m.assetId = "tree/" + id;
    m.materialId = "foliage";
    m.groundRadius = ground;
    m.canopyRadius = canopy;
    m.minScale = minScale;
    m.maxScale = maxScale;
    m.palette = std::move(palette);
    return m;
}

SpeciesMetadata rock(const std::string& id, double ground, double minScale,
                     double maxScale, std::vector<uint32_t> palette) {
    SpeciesMetadata m;
    m.id = id;
    m.assetId = "rock/" + id;
    m.materialId = "stone";
    m.groundRadius = ground;
    m.minScale = minScale;
    m.maxScale = maxScale;
    m.palette = std::move(palette);
    return m;
}

SpeciesMetadata shrub(const std::string& id, double ground, double spacing,
                      double minScale, double maxScale, std::vector<uint32_t> palette) {
    SpeciesMetadata m;
    m.id = id;
    m.assetId = "shrub/" + id;
    m.materialId = "foliage";
    m.groundRadius = ground;
    m.speciesSpacing = spacing;
    m.minScale = minScale;
    m.maxScale = maxScale;
    m.palette = std::move(palette);
    return m;
}

SpeciesMetadata creature(const std::string& id, double ground, double spacing) {
    SpeciesMetadata m;
    m.id = id;
    m.assetId = "creature/" + id;
    m.materialId = "creature";
    m.groundRadius = ground;
    m.speciesSpacing = spacing;
    m.spawnsEntity = true;
    return m;
}

FitnessPtr riverBank(double min0, double min1) {
    return Signal::linearEaseIn(Signal::distanceToRiver(), min0, min1);
}

FitnessPtr nearWater(double max1, double max0) {
    return Signal::linearEaseOut(Signal::distanceToRiver(), max1, max0);
}

FitnessPtr gentleSlope(double maxDegrees) {
    return Signal::inRange(Signal::slope(), 0.0, maxDegrees);
}

DecorationRulePtr speciesRule(std::shared_ptr<const Species> species) {
    return std::make_shared<SpeciesRule>(std::move(species));
}

DecorationRuleList happyRules() {
    auto oak = std::make_shared<TreeSpecies>(
        tree("oak", 1.5, 6.0, 0.8, 1.3, {0x4F7F2A, 0x5C8F34, 0x3F6B22}),
        Combine::all({Signal::constant(0.9), riverBank(4.0, 20.0),
                      Signal::noise2D(120.0, 120.0), gentleSlope(30.0)}));
    auto birch = std::make_shared<TreeSpecies>(
        tree("birch", 1.0, 4.0, 0.8, 1.2, {0x9CC25A, 0x8DB84A}),
        Combine::all({Signal::constant(0.8), riverBank(2.0, 10.0),
                      Signal::noise2D(80.0, 80.0, 37.0, 11.0), gentleSlope(35.0)}));
    auto boulder = std::make_shared<RockSpecies>(
        rock("boulder", 2.0, 0.5, 2.0, {0x8A8A8A, 0x777777}),
        makeFitness(FitnessParams{.fitness = 0.25,
                                  .stepDistance = Range{1.0, Signal::UNBOUNDED}}));
    auto flowers = std::make_shared<ShrubSpecies>(
        shrub("flowers", 0.5, 1.5, 0.6, 1.0, {0xF2D649, 0xE86F9E, 0xFFFFFF}),
        Combine::all({Signal::constant(0.6), riverBank(1.0, 4.0),
                      Signal::step(Signal::noise2D(30.0, 30.0, 5.0, 5.0), 0.45)}));

    return {std::make_shared<TierRule>("trees", std::vector<SpeciesPtr>{oak, birch}),
            speciesRule(boulder), speciesRule(flowers)};
}

DecorationRuleList forestRules() {
    auto pine = std::make_shared<TreeSpecies>(
        tree("pine", 1.2, 4.5, 0.9, 1.6, {0x24502C, 0x2E5E34}),
        Combine::all({Signal::constant(1.0), riverBank(3.0, 12.0), gentleSlope(40.0)}));
    auto oak = std::make_shared<TreeSpecies>(
        tree("oak", 1.5, 6.0, 0.9, 1.4, {0x3F6B22, 0x4F7F2A}),
        Combine::all({Signal::constant(0.9), riverBank(5.0, 15.0),
                      Signal::noise2D(150.0, 150.0, 91.0, 3.0)}));
    auto fern = std::make_shared<ShrubSpecies>(
        shrub("fern", 0.6, 1.2, 0.7, 1.1, {0x3E7A3A, 0x4C8C44}),
        Combine::all({Signal::constant(0.7), riverBank(1.0, 3.0), gentleSlope(30.0)}));
    auto mossRock = std::make_shared<RockSpecies>(
        rock("mossy-rock", 1.5, 0.5, 1.5, {0x5E6B4E, 0x6F7A5C}),
        makeFitness(FitnessParams{.fitness = 0.2,
                                  .stepDistance = Range{0.5, Signal::UNBOUNDED}}));

    return {std::make_shared<TierRule>("trees", std::vector<SpeciesPtr>{pine, oak}),
            speciesRule(mossRock), speciesRule(fern)};
}

DecorationRuleList desertRules() {
    auto cactus = std::make_shared<ShrubSpecies>(
        shrub("cactus", 1.0, 8.0, 0.7, 1.5, {0x5B8C3A, 0x6A9A45}),
        Combine::all({Signal::constant(0.5), riverBank(8.0, 25.0),
                      Signal::step(Signal::noise2D(60.0, 60.0, 13.0, 71.0), 0.4)}));
    auto sandstone = std::make_shared<RockSpecies>(
        rock("sandstone", 2.5, 0.6, 3.0, {0xC2955A, 0xB5834A, 0xD1A46C}),
        Combine::all({Signal::constant(0.35), riverBank(2.0, 6.0)}));
    auto palm = std::make_shared<TreeSpecies>(
        tree("palm", 1.0, 5.0, 0.9, 1.3, {0x6B8E23}),
        Combine::all({Signal::constant(0.8), riverBank(0.5, 2.0), nearWater(6.0, 15.0)}));

    return {speciesRule(palm), speciesRule(sandstone), speciesRule(cactus)};
}

DecorationRuleList iceRules() {
    auto snowPine = std::make_shared<TreeSpecies>(
        tree("snow-pine", 1.2, 4.0, 0.8, 1.4, {0xE8F0F2, 0xD5E3E8}),
        Combine::all({Signal::constant(0.6), riverBank(4.0, 15.0),
                      Signal::noise2D(100.0, 100.0, 7.0, 29.0), gentleSlope(35.0)}));
    auto iceRock = std::make_shared<RockSpecies>(
        rock("ice-rock", 2.0, 0.5, 2.5, {0xBFD9E6, 0xA8C8D8}),
        Combine::all({Signal::constant(0.3), riverBank(0.5, 3.0)}));
    auto polarBear = std::make_shared<ShrubSpecies>(
        creature("polar-bear", 3.0, 120.0),
        Combine::all({Signal::constant(0.02), riverBank(2.0, 8.0),
                      Signal::inRange(Signal::biomeProgress(), 0.2, 0.8)}));

    return {std::make_shared<TierRule>("trees", std::vector<SpeciesPtr>{snowPine}),
            speciesRule(iceRock), speciesRule(polarBear)};
}

DecorationRuleList swampRules() {
    auto mangrove = std::make_shared<TreeSpecies>(
        tree("mangrove", 1.5, 5.5, 0.8, 1.4, {0x3B4A2A, 0x465734}),
        Combine::all({Signal::constant(0.9), riverBank(-2.0, 0.0), nearWater(4.0, 20.0),
                      Signal::max(Signal::noise2D(70.0, 70.0, 19.0, 43.0),
                                  Signal::constant(0.3))}));
    auto willow = std::make_shared<TreeSpecies>(
        tree("willow", 1.3, 6.5, 0.9, 1.3, {0x5A6E3A}),
        Combine::all({Signal::constant(0.7), riverBank(3.0, 10.0)}));
    auto reeds = std::make_shared<ShrubSpecies>(
        shrub("reeds", 0.4, 0.8, 0.8, 1.2, {0x7B8A45, 0x6E7C3C}),
        Combine::all({Signal::constant(0.8),
                      Signal::smoothRange(Signal::distanceToRiver(), -1.0, 0.5, 3.0, 6.0)}));

    return {std::make_shared<TierRule>("trees", std::vector<SpeciesPtr>{mangrove, willow}),
            speciesRule(reeds)};
}

DecorationRuleList jurassicRules() {
    auto cycad = std::make_shared<TreeSpecies>(
        tree("cycad", 1.2, 4.5, 0.8, 1.5, {0x2F6B2F, 0x3A7A30}),
        Combine::all({Signal::constant(0.9), riverBank(3.0, 12.0), gentleSlope(35.0)}));
    auto treeFern = std::make_shared<TreeSpecies>(
        tree("tree-fern", 1.0, 3.5, 0.9, 1.6, {0x3E8A3A, 0x4A9A40}),
        Combine::all({Signal::constant(0.85), riverBank(1.0, 6.0),
                      Signal::noise2D(90.0, 90.0, 53.0, 17.0)}));
    auto volcanicRock = std::make_shared<RockSpecies>(
        rock("volcanic-rock", 3.0, 0.6, 3.5, {0x3A3330, 0x4A403A}),
        makeFitness(FitnessParams{.fitness = 0.2,
                                  .stepDistance = Range{1.0, Signal::UNBOUNDED},
                                  .slope = Range{0.0, 45.0}}));

    return {std::make_shared<TierRule>("trees", std::vector<SpeciesPtr>{cycad, treeFern}),
            speciesRule(volcanicRock)};
}

} // namespace

CatalogSpecies::CatalogSpecies(SpeciesMetadata metadata, FitnessPtr preference)
    : m_metadata(std::move(metadata)), m_preference(std::move(preference)) {
    if (!m_preference) {
        throw std::invalid_argument("Species '" + m_metadata.id + "' has no preference");
    }
    if (m_metadata.minScale > m_metadata.maxScale) {
        throw std::invalid_argument("Species '" + m_metadata.id +
                                    "' has minScale greater than maxScale");
    }
}

double CatalogSpecies::preference(const DecorationContext& ctx) const {
    return m_preference->evaluate(ctx);
}

double CatalogSpecies::drawScale(const DecorationContext& ctx) const {
    return m_metadata.minScale + (m_metadata.maxScale - m_metadata.minScale) * ctx.random();
}

uint32_t CatalogSpecies::drawColor(const DecorationContext& ctx) const {
    if (m_metadata.palette.empty()) {
        return 0xFFFFFF;
    }
    const size_t index = std::min(m_metadata.palette.size() - 1,
                                  static_cast<size_t>(ctx.random() * m_metadata.palette.size()));
    return m_metadata.palette[index];
}

void CatalogSpecies::shape(PlacementParams& params, double scale) const {
    params.groundRadius = m_metadata.groundRadius * scale;
    params.canopyRadius = m_metadata.canopyRadius * scale;
    params.speciesRadius = m_metadata.speciesSpacing;
}

std::optional<PlacementParams> CatalogSpecies::generate(const DecorationContext& ctx) const {
    const double scale = drawScale(ctx);

    PlacementParams params;
    params.speciesId = m_metadata.id;
    shape(params, scale);

    params.options.kind = m_metadata.id;
    params.options.assetId = m_metadata.assetId;
    params.options.materialId = m_metadata.materialId;
    params.options.scale = scale;
    params.options.rotation = ctx.random() * TWO_PI;
    params.options.color = drawColor(ctx);
    params.options.spawnsEntity = m_metadata.spawnsEntity;
    return params;
}

void TreeSpecies::shape(PlacementParams& params, double scale) const {
    CatalogSpecies::shape(params, scale);
    // Trunks stay thin as the crown grows
    params.groundRadius = m_metadata.groundRadius * std::sqrt(scale);
}

double RockSpecies::drawScale(const DecorationContext& ctx) const {
    const double t = ctx.random();
    return m_metadata.minScale + (m_metadata.maxScale - m_metadata.minScale) * t * t;
}

void RockSpecies::shape(PlacementParams& params, double scale) const {
    params.groundRadius = m_metadata.groundRadius * scale;
    params.canopyRadius = 0.0;
    params.speciesRadius = m_metadata.speciesSpacing;
}

void ShrubSpecies::shape(PlacementParams& params, double scale) const {
    params.groundRadius = m_metadata.groundRadius * scale;
    params.canopyRadius = 0.0;
    params.speciesRadius = m_metadata.speciesSpacing * scale;
}

DecorationCatalog::DecorationCatalog() {
    m_rules[static_cast<size_t>(BiomeType::HAPPY)] = happyRules();
    m_rules[static_cast<size_t>(BiomeType::FOREST)] = forestRules();
    m_rules[static_cast<size_t>(BiomeType::DESERT)] = desertRules();
    m_rules[static_cast<size_t>(BiomeType::ICE)] = iceRules();
    m_rules[static_cast<size_t>(BiomeType::SWAMP)] = swampRules();
    m_rules[static_cast<size_t>(BiomeType::JURASSIC)] = jurassicRules();
}

const DecorationRuleList& DecorationCatalog::getRules(BiomeType type) const {
    const auto index = static_cast<size_t>(type);
    if (index >= m_rules.size()) {
        throw std::out_of_range("Unknown biome type " + std::to_string(index));
    }
    return m_rules[index];
}

} // namespace RiverForge
