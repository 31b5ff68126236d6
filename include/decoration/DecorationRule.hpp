/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DECORATION_RULE_HPP
#define DECORATION_RULE_HPP

#include "decoration/DecorationContext.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace RiverForge {

/**
 * @brief One kind of decoration that competes for space inside a tier
 */
class Species {
public:
    virtual ~Species() = default;

    virtual const std::string& id() const = 0;

    /**
     * @brief How strongly this species wants to grow at ctx
     * @return score, placement probability once clamped to [0, 1]
     */
    virtual double preference(const DecorationContext& ctx) const = 0;

    /**
     * @brief Concrete instance parameters for an accepted point
     * @return std::nullopt to decline the point
     */
    virtual std::optional<PlacementParams> generate(const DecorationContext& ctx) const = 0;
};

using SpeciesPtr = std::shared_ptr<const Species>;

/**
 * @brief Unit of work for the Poisson sampler: a fitness plus a generator
 */
class DecorationRule {
public:
    virtual ~DecorationRule() = default;

    virtual const std::string& id() const = 0;
    virtual double fitness(const DecorationContext& ctx) const = 0;
    virtual std::optional<PlacementParams> generate(const DecorationContext& ctx) const = 0;
};

using DecorationRulePtr = std::shared_ptr<const DecorationRule>;
using DecorationRuleList = std::vector<DecorationRulePtr>;

/**
 * @brief Several species sharing one layer (e.g. all trees)
 *
 * Fitness is the best member preference. The member with the highest
 * preference generates; the first one wins ties.
 */
class TierRule : public DecorationRule {
public:
    TierRule(std::string id, std::vector<SpeciesPtr> members);

    const std::string& id() const override { return m_id; }
    double fitness(const DecorationContext& ctx) const override;
    std::optional<PlacementParams> generate(const DecorationContext& ctx) const override;

    const std::vector<SpeciesPtr>& getMembers() const { return m_members; }

private:
    std::string m_id;
    std::vector<SpeciesPtr> m_members;

    std::pair<const Species*, double> bestMember(const DecorationContext& ctx) const;
};

// A single species placed on its own
class SpeciesRule : public DecorationRule {
public:
    explicit SpeciesRule(SpeciesPtr species);

    const std::string& id() const override { return m_species->id(); }
    double fitness(const DecorationContext& ctx) const override;
    std::optional<PlacementParams> generate(const DecorationContext& ctx) const override;

private:
    SpeciesPtr m_species;
};

} // namespace RiverForge

#endif // DECORATION_RULE_HPP
