// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/constraint.hpp>
#include <microcosm/format.hpp>

#include <unordered_set>

namespace mcm {

static constexpr std::string_view community_biomass = "communityBiomass";
static constexpr std::string_view community_objective =
  "EX_microbeBiomass[fe]";

static std::unordered_set<std::string_view> community_components(
  const model& m,
  const i32    biomass)
{
    constexpr std::string_view suffix = "_biomass[c]";

    std::unordered_set<std::string_view> ret;

    for (const auto& c : m.stoichiometry(biomass)) {
        std::string_view id = m.metabolite(c.row);

        if (id.ends_with(suffix)) {
            id.remove_suffix(suffix.size());
            ret.emplace(id);
        }
    }

    return ret;
}

static bool owned_by(const std::unordered_set<std::string_view>& components,
                     std::string_view                            id,
                     std::string_view                            tag) noexcept
{
    const auto pos = id.find(tag);

    return pos != std::string_view::npos and pos > 0u and
           components.contains(id.substr(0, pos));
}

static bool is_opened(const reaction_role role) noexcept
{
    switch (role) {
    case reaction_role::exchange:
    case reaction_role::diet_exchange:
    case reaction_role::fecal_exchange:
    case reaction_role::diet_transport:
    case reaction_role::fecal_transport:
        return true;
    default:
        return false;
    }
}

result<model> apply_base_constraints(const model&            community,
                                     const batch_parameters& params)
{
    model m = community;

    const auto biomass = m.find_reaction(community_biomass);
    if (not biomass.has_value())
        return new_error(constraint_errc::missing_community_biomass,
                         e_reaction{ community_biomass });

    const auto objective = m.find_reaction(community_objective);
    if (not objective.has_value())
        return new_error(constraint_errc::missing_objective,
                         e_reaction{ community_objective });

    const auto components = community_components(m, *biomass);

    std::string renamed;

    for (i32 j = 0, e = m.reaction_count(); j != e; ++j) {
        switch (m.role(j)) {
        case reaction_role::biomass:
            m.set_lower_bound(j, 0.0);
            break;

        case reaction_role::demand:
            if (owned_by(components, m.reaction(j), "_DM_"))
                m.set_lower_bound(j, 0.0);
            break;

        case reaction_role::sink:
            if (owned_by(components, m.reaction(j), "_sink_"))
                m.set_lower_bound(j, -1.0);
            break;

        case reaction_role::diet_exchange:
            if (m.reaction(j).starts_with("EX_")) {
                format(renamed, "Diet_{}", m.reaction(j));
                mcm_check(m.rename_reaction(j, renamed));
            }
            break;

        default:
            break;
        }

        if (is_opened(m.role(j)))
            m.set_upper_bound(j, open_flux_bound);
    }

    m.change_objective(*objective);
    m.set_bounds(*biomass, params.lower_biomass_bound, 1.0);

    if (params.host.has_value())
        mcm_check(apply_host_constraints(m, *params.host));

    return m;
}

status apply_host_constraints(model& m, const host_parameters& host)
{
    for (i32 j = 0, e = m.reaction_count(); j != e; ++j) {
        const auto role = m.role(j);

        if (role == reaction_role::host_blood_exchange or
            role == reaction_role::host_lumen_exchange)
            m.set_lower_bound(j, 0.0);
    }

    std::string id;

    for (const auto met : host_uptake_metabolites) {
        for (const auto suffix : { "[e]b", "(e)b" }) {
            format(id, "Host_EX_{}{}", met, suffix);
            if (const auto j = m.find_reaction(id); j.has_value())
                m.set_lower_bound(*j, host_uptake_bound);
        }
    }

    for (const auto& met : human_metabolites) {
        format(id, "Host_IEX_{}[u]tr", met.metabolite);
        if (const auto j = m.find_reaction(id); j.has_value())
            m.set_lower_bound(*j, -default_flux_bound);
    }

    format(id, "Host_{}", host.biomass_reaction);
    const auto biomass = m.find_reaction(id);
    if (not biomass.has_value())
        return new_error(constraint_errc::missing_host_biomass,
                         e_reaction{ id });

    m.set_bounds(*biomass, host_biomass_lower_bound, host.biomass_flux_cap);

    return success();
}

int apply_diet(model&            m,
               const diet_table& diet,
               bool              include_human_metabolites)
{
    for (i32 j = 0, e = m.reaction_count(); j != e; ++j)
        if (m.role(j) == reaction_role::diet_exchange)
            m.set_lower_bound(j, 0.0);

    int missing = 0;

    for (sz i = 0; i < diet.size(); ++i) {
        if (const auto j = m.find_reaction(diet.reactions[i]); j.has_value())
            m.set_lower_bound(*j, diet.values[i]);
        else
            ++missing;
    }

    if (include_human_metabolites) {
        std::string id;

        for (const auto& met : human_metabolites) {
            format(id, "Diet_EX_{}[d]", met.metabolite);
            if (const auto j = m.find_reaction(id); j.has_value())
                m.set_lower_bound(*j, met.value);
        }
    }

    return missing;
}

std::vector<i32> fecal_exchanges(const model& m)
{
    std::vector<i32> ret;

    for (i32 j = 0, e = m.reaction_count(); j != e; ++j)
        if (m.role(j) == reaction_role::fecal_exchange and
            m.reaction(j) != community_objective)
            ret.emplace_back(j);

    return ret;
}

std::vector<i32> paired_diet_exchanges(const model&         m,
                                       std::span<const i32> fecal)
{
    std::vector<i32> ret;
    ret.reserve(fecal.size());

    std::string id;

    for (const auto j : fecal) {
        std::string_view name = m.reaction(j);
        if (name.starts_with("EX_"))
            name.remove_prefix(3u);

        const auto base = base_name(name);

        format(id, "Diet_EX_{}[d]", base);
        auto diet = m.find_reaction(id);

        if (not diet.has_value()) {
            format(id, "EX_{}[d]", base);
            diet = m.find_reaction(id);
        }

        ret.emplace_back(diet.has_value() ? *diet : -1);
    }

    return ret;
}

} // namespace mcm
