/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "decoration/DecorationRule.hpp"
#include <stdexcept>

namespace RiverForge {

TierRule::TierRule(std::string id, std::vector<SpeciesPtr> members)
    : m_id(std::move(id)), m_members(std::move(members)) {
    if (m_members.empty()) {
        throw std::invalid_argument("TierRule '" + m_id + "' needs at least one species");
    }
    for (const auto& member : m_members) {
        if (!member) {
            throw std::invalid_argument("TierRule '" + m_id + "' has a null species");
        }
    }
}

std::pair<const Species*, double> TierRule::bestMember(const DecorationContext& ctx) const {
    const Species* best = nullptr;
    double bestScore = 0.0;
    for (const auto& member : m_members) {
        const double score = member->preference(ctx);
        if (!best || score > bestScore) {
            best = member.get();
            bestScore = score;
        }
    }
    return {best, bestScore};
}

double TierRule::fitness(const DecorationContext& ctx) const {
    return bestMember(ctx).second;
}

std::optional<PlacementParams> TierRule::generate(const DecorationContext& ctx) const {
    return bestMember(ctx).first->generate(ctx);
}

SpeciesRule::SpeciesRule(SpeciesPtr species) : m_species(std::move(species)) {
    if (!m_species) {
        throw std::invalid_argument("SpeciesRule requires a species");
    }
}

double SpeciesRule::fitness(const DecorationContext& ctx) const {
    return m_species->preference(ctx);
}

std::optional<PlacementParams> SpeciesRule::generate(const DecorationContext& ctx) const {
    return m_species->generate(ctx);
}

} // namespace RiverForge
