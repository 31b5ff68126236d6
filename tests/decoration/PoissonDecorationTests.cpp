/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE PoissonDecorationTests
#include <boost/test/unit_test.hpp>

#include "decoration/DecorationCatalog.hpp"
#include "decoration/PoissonDecorationStrategy.hpp"
#include "mocks/MockTerrain.hpp"
#include "world/PerlinNoise.hpp"
#include <cmath>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

using namespace RiverForge;

namespace {

// Fixed score and radii everywhere
class TestSpecies : public Species {
public:
    TestSpecies(std::string id, double score, double ground, double canopy = 0.0,
                double spacing = 0.0)
        : m_id(std::move(id)), m_score(score), m_ground(ground), m_canopy(canopy),
          m_spacing(spacing) {}

    const std::string& id() const override { return m_id; }
    double preference(const DecorationContext&) const override { return m_score; }

    std::optional<PlacementParams> generate(const DecorationContext&) const override {
        ++generateCalls;
        if (refuse) {
            return std::nullopt;
        }
        PlacementParams params;
        params.speciesId = m_id;
        params.groundRadius = m_ground;
        params.canopyRadius = m_canopy;
        params.speciesRadius = m_spacing;
        params.options.kind = m_id;
        params.options.assetId = "test/" + m_id;
        params.options.materialId = "test";
        return params;
    }

    bool refuse{false};
    mutable int generateCalls{0};

private:
    std::string m_id;
    double m_score;
    double m_ground;
    double m_canopy;
    double m_spacing;
};

DecorationRulePtr ruleFor(std::shared_ptr<const Species> species) {
    return std::make_shared<SpeciesRule>(std::move(species));
}

double distance(const DecorationPlacement& a, const DecorationPlacement& b) {
    return std::hypot(a.x - b.x, a.z - b.z);
}

} // namespace

struct PoissonFixture {
    PoissonFixture() : noise(99), strategy(noise) {
        region.xMin = -50.0;
        region.xMax = 50.0;
        region.zMin = 0.0;
        region.zMax = 62.5;
    }

    std::vector<DecorationPlacement> run(const DecorationRuleList& rules, SpatialGrid& grid,
                                         uint32_t seed = 1234) {
        return strategy.generate(rules, region, grid, sampler,
                                 [this](double z) { return sampler.sampleBiomeProgress(z); },
                                 seed);
    }

    PerlinNoise noise;
    PoissonDecorationStrategy strategy;
    FlatTerrainSampler sampler;
    Region region;
};

BOOST_AUTO_TEST_SUITE(PoissonConfigTests)

BOOST_AUTO_TEST_CASE(RejectsInvalidConfig) {
    PerlinNoise noise(1);
    BOOST_CHECK_THROW(PoissonDecorationStrategy(noise, PoissonConfig{-1, 30}),
                      std::invalid_argument);
    BOOST_CHECK_THROW(PoissonDecorationStrategy(noise, PoissonConfig{100, 0}),
                      std::invalid_argument);
    BOOST_CHECK_NO_THROW(PoissonDecorationStrategy(noise, PoissonConfig{0, 1}));
}

BOOST_AUTO_TEST_CASE(RegionContainsIsHalfOpenInZ) {
    Region region{0.0, 10.0, 0.0, 10.0};
    BOOST_CHECK(region.contains(0.0, 0.0));
    BOOST_CHECK(region.contains(10.0, 5.0));
    BOOST_CHECK(!region.contains(5.0, 10.0));
    BOOST_CHECK(!region.contains(-0.1, 5.0));
    BOOST_CHECK(!region.empty());
    BOOST_CHECK((Region{0.0, 10.0, 5.0, 5.0}.empty()));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(PoissonPlacementTests, PoissonFixture)

BOOST_AUTO_TEST_CASE(PlacementsKeepGroundSeparation) {
    auto species = std::make_shared<TestSpecies>("stone", 1.0, 1.5);
    SpatialGrid grid(8.0);
    const auto placements = run({ruleFor(species)}, grid);

    BOOST_REQUIRE_GT(placements.size(), 10u);
    for (size_t i = 0; i < placements.size(); ++i) {
        for (size_t j = i + 1; j < placements.size(); ++j) {
            BOOST_CHECK_GE(distance(placements[i], placements[j]), 3.0 - 1e-9);
        }
    }
}

BOOST_AUTO_TEST_CASE(PlacementsStayInsideRegion) {
    auto species = std::make_shared<TestSpecies>("stone", 1.0, 1.0);
    SpatialGrid grid(8.0);
    for (const auto& p : run({ruleFor(species)}, grid)) {
        BOOST_CHECK(region.contains(p.x, p.z));
        BOOST_CHECK_EQUAL(p.y, sampler.sample.height);
        BOOST_CHECK_EQUAL(p.speciesId, "stone");
    }
}

BOOST_AUTO_TEST_CASE(PlacementsAreRegisteredInGrid) {
    auto species = std::make_shared<TestSpecies>("stone", 1.0, 1.0);
    SpatialGrid grid(8.0);
    const auto placements = run({ruleFor(species)}, grid);
    BOOST_CHECK_EQUAL(grid.size(), placements.size());
}

BOOST_AUTO_TEST_CASE(GrowthFillsTheRegion) {
    // A single seed attempt still spreads across the region through growth
    PoissonDecorationStrategy sparse(noise, PoissonConfig{1, 30});
    auto species = std::make_shared<TestSpecies>("stone", 1.0, 2.0);
    SpatialGrid grid(8.0);
    const auto placements = sparse.generate({ruleFor(species)}, region, grid, sampler,
                                            nullptr, 77);
    BOOST_CHECK_GT(placements.size(), 20u);
}

BOOST_AUTO_TEST_CASE(ZeroFitnessPlacesNothing) {
    auto species = std::make_shared<TestSpecies>("ghost", 0.0, 1.0);
    SpatialGrid grid(8.0);
    BOOST_CHECK(run({ruleFor(species)}, grid).empty());
    BOOST_CHECK_EQUAL(species->generateCalls, 0);
}

BOOST_AUTO_TEST_CASE(NegativeFitnessPlacesNothing) {
    auto species = std::make_shared<TestSpecies>("ghost", -2.0, 1.0);
    SpatialGrid grid(8.0);
    BOOST_CHECK(run({ruleFor(species)}, grid).empty());
}

BOOST_AUTO_TEST_CASE(FitnessAboveOneIsClamped) {
    auto species = std::make_shared<TestSpecies>("stone", 5.0, 1.0);
    SpatialGrid grid(8.0);
    for (const auto& p : run({ruleFor(species)}, grid)) {
        BOOST_CHECK_EQUAL(p.fitness, 1.0);
    }
}

BOOST_AUTO_TEST_CASE(RefusedGenerationPlacesNothing) {
    auto species = std::make_shared<TestSpecies>("stone", 1.0, 1.0);
    species->refuse = true;
    SpatialGrid grid(8.0);
    BOOST_CHECK(run({ruleFor(species)}, grid).empty());
    BOOST_CHECK_GT(species->generateCalls, 0);
}

BOOST_AUTO_TEST_CASE(ZeroSeedAttemptsPlacesNothing) {
    PoissonDecorationStrategy none(noise, PoissonConfig{0, 30});
    auto species = std::make_shared<TestSpecies>("stone", 1.0, 1.0);
    SpatialGrid grid(8.0);
    BOOST_CHECK(none.generate({ruleFor(species)}, region, grid, sampler, nullptr, 1).empty());
}

BOOST_AUTO_TEST_CASE(EmptyRegionPlacesNothing) {
    auto species = std::make_shared<TestSpecies>("stone", 1.0, 1.0);
    SpatialGrid grid(8.0);
    region.zMax = region.zMin;
    BOOST_CHECK(run({ruleFor(species)}, grid).empty());
}

BOOST_AUTO_TEST_CASE(TinyGroundRadiusIsFloored) {
    auto species = std::make_shared<TestSpecies>("moss", 1.0, 0.0);
    SpatialGrid grid(8.0);
    region.xMin = 0.0;
    region.xMax = 2.0;
    region.zMax = 2.0;
    const auto placements = run({ruleFor(species)}, grid);
    BOOST_REQUIRE(!placements.empty());
    for (const auto& p : placements) {
        BOOST_CHECK_GE(p.groundRadius, 0.01);
    }
}

BOOST_AUTO_TEST_CASE(SameSeedSameResult) {
    auto species = std::make_shared<TestSpecies>("stone", 0.7, 1.2, 3.0);
    SpatialGrid gridA(8.0);
    SpatialGrid gridB(8.0);
    const auto a = run({ruleFor(species)}, gridA, 42);
    const auto b = run({ruleFor(species)}, gridB, 42);

    BOOST_REQUIRE_EQUAL(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        BOOST_CHECK_EQUAL(a[i].x, b[i].x);
        BOOST_CHECK_EQUAL(a[i].z, b[i].z);
    }
}

BOOST_AUTO_TEST_CASE(DifferentSeedDifferentResult) {
    auto species = std::make_shared<TestSpecies>("stone", 1.0, 1.2);
    SpatialGrid gridA(8.0);
    SpatialGrid gridB(8.0);
    const auto a = run({ruleFor(species)}, gridA, 1);
    const auto b = run({ruleFor(species)}, gridB, 2);
    BOOST_REQUIRE(!a.empty());
    BOOST_REQUIRE(!b.empty());
    BOOST_CHECK(a.front().x != b.front().x || a.front().z != b.front().z);
}

BOOST_AUTO_TEST_CASE(LaterRulesAvoidEarlierPlacements) {
    auto big = std::make_shared<TestSpecies>("tree", 1.0, 2.0, 5.0);
    auto small = std::make_shared<TestSpecies>("rock", 1.0, 0.5);
    SpatialGrid grid(8.0);
    const auto placements = run({ruleFor(big), ruleFor(small)}, grid);

    for (const auto& rock : placements) {
        if (rock.speciesId != "rock") continue;
        for (const auto& tree : placements) {
            if (tree.speciesId != "tree") continue;
            BOOST_CHECK_GE(distance(rock, tree), 2.5 - 1e-9);
        }
    }
}

BOOST_AUTO_TEST_CASE(SharedGridCarriesAcrossCalls) {
    auto species = std::make_shared<TestSpecies>("stone", 1.0, 1.5);
    SpatialGrid grid(8.0);
    const auto first = run({ruleFor(species)}, grid, 5);
    const auto second = run({ruleFor(species)}, grid, 6);

    for (const auto& a : first) {
        for (const auto& b : second) {
            BOOST_CHECK_GE(distance(a, b), 3.0 - 1e-9);
        }
    }
}

BOOST_AUTO_TEST_CASE(CanopiesDoNotOverlap) {
    auto species = std::make_shared<TestSpecies>("tree", 1.0, 0.5, 4.0);
    SpatialGrid grid(8.0);
    const auto placements = run({ruleFor(species)}, grid);
    BOOST_REQUIRE_GT(placements.size(), 1u);
    for (size_t i = 0; i < placements.size(); ++i) {
        for (size_t j = i + 1; j < placements.size(); ++j) {
            BOOST_CHECK_GE(distance(placements[i], placements[j]), 8.0 - 1e-9);
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DecorationRuleTests, PoissonFixture)

BOOST_AUTO_TEST_CASE(TierRuleRequiresMembers) {
    BOOST_CHECK_THROW(TierRule("empty", {}), std::invalid_argument);
    BOOST_CHECK_THROW(TierRule("null", {nullptr}), std::invalid_argument);
    BOOST_CHECK_THROW(SpeciesRule(nullptr), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TierRuleUsesBestMember) {
    auto low = std::make_shared<TestSpecies>("low", 0.2, 1.0);
    auto high = std::make_shared<TestSpecies>("high", 0.8, 1.0);
    TierRule tier("trees", {low, high});

    std::mt19937 rng(1);
    DecorationContext ctx{0.0, 0.0, 0.0, 0.0, 10.0, 0.5, rng, noise};

    BOOST_CHECK_CLOSE(tier.fitness(ctx), 0.8, 1e-9);
    const auto params = tier.generate(ctx);
    BOOST_REQUIRE(params.has_value());
    BOOST_CHECK_EQUAL(params->speciesId, "high");
    BOOST_CHECK_EQUAL(low->generateCalls, 0);
}

BOOST_AUTO_TEST_CASE(TierRuleTieGoesToFirstMember) {
    auto first = std::make_shared<TestSpecies>("first", 0.5, 1.0);
    auto second = std::make_shared<TestSpecies>("second", 0.5, 1.0);
    TierRule tier("trees", {first, second});

    std::mt19937 rng(1);
    DecorationContext ctx{0.0, 0.0, 0.0, 0.0, 10.0, 0.5, rng, noise};
    BOOST_CHECK_EQUAL(tier.generate(ctx)->speciesId, "first");
}

BOOST_AUTO_TEST_CASE(SpeciesRuleForwards) {
    auto species = std::make_shared<TestSpecies>("stone", 0.4, 1.0);
    SpeciesRule rule(species);

    std::mt19937 rng(1);
    DecorationContext ctx{0.0, 0.0, 0.0, 0.0, 10.0, 0.5, rng, noise};
    BOOST_CHECK_EQUAL(rule.id(), "stone");
    BOOST_CHECK_CLOSE(rule.fitness(ctx), 0.4, 1e-9);
    BOOST_CHECK_EQUAL(rule.generate(ctx)->speciesId, "stone");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DecorationCatalogTests, PoissonFixture)

BOOST_AUTO_TEST_CASE(EveryBiomeHasRules) {
    DecorationCatalog catalog;
    for (BiomeType type : {BiomeType::HAPPY, BiomeType::FOREST, BiomeType::DESERT,
                           BiomeType::ICE, BiomeType::SWAMP, BiomeType::JURASSIC}) {
        BOOST_TEST_CONTEXT("biome " << type) {
            BOOST_CHECK(!catalog.getRules(type).empty());
        }
    }
}

BOOST_AUTO_TEST_CASE(UnknownBiomeThrows) {
    DecorationCatalog catalog;
    BOOST_CHECK_THROW(catalog.getRules(static_cast<BiomeType>(42)), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(HappyBiomePlacesKnownSpecies) {
    DecorationCatalog catalog;
    region.xMin = -200.0;
    region.xMax = 200.0;
    SpatialGrid grid(8.0);
    const auto placements = run(catalog.getRules(BiomeType::HAPPY), grid, 2024);

    const std::set<std::string> known{"oak", "birch", "boulder", "flowers"};
    size_t boulders = 0;
    for (const auto& p : placements) {
        BOOST_CHECK(known.count(p.speciesId) == 1);
        BOOST_CHECK(!p.options.assetId.empty());
        BOOST_CHECK_GT(p.options.scale, 0.0);
        if (p.speciesId == "boulder") {
            ++boulders;
            BOOST_CHECK_EQUAL(p.canopyRadius, 0.0);
        }
    }
    BOOST_CHECK_GT(boulders, 0u);
}

BOOST_AUTO_TEST_CASE(NothingGrowsInTheRiver) {
    DecorationCatalog catalog;
    sampler.sample.distanceToRiver = -10.0;
    SpatialGrid grid(8.0);
    BOOST_CHECK(run(catalog.getRules(BiomeType::HAPPY), grid).empty());
}

BOOST_AUTO_TEST_CASE(CreaturesSpawnEntities) {
    DecorationCatalog catalog;
    sampler.sample.distanceToRiver = 30.0;
    region.xMin = -200.0;
    region.xMax = 200.0;
    region.zMax = 400.0;
    SpatialGrid grid(8.0);
    const auto placements = run(catalog.getRules(BiomeType::ICE), grid, 9);
    for (const auto& p : placements) {
        BOOST_CHECK_EQUAL(p.options.spawnsEntity, p.speciesId == "polar-bear");
    }
}

BOOST_AUTO_TEST_SUITE_END()
