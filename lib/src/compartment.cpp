// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/assembly.hpp>
#include <microcosm/format.hpp>

#include <algorithm>

namespace mcm {

std::string_view biomass_base_name(std::string_view objective_reaction) noexcept
{
    if (objective_reaction.starts_with("EX_"))
        objective_reaction.remove_prefix(3u);

    if (objective_reaction.ends_with("(e)") or
        objective_reaction.ends_with("[e]"))
        objective_reaction.remove_suffix(3u);

    return objective_reaction;
}

result<model> build_compartments(std::span<const std::string> exchanges,
                                 std::string_view             objective_reaction)
{
    const auto biomass = biomass_base_name(objective_reaction);

    std::vector<std::string_view> bases;
    bases.reserve(exchanges.size());

    for (const auto& id : exchanges) {
        if (compartment_of(id) != compartment::extracellular)
            return new_error(assembly_errc::bad_exchange_metabolite,
                             e_metabolite{ id });

        if (const auto base = base_name(id); base != biomass)
            bases.emplace_back(base);
    }

    std::sort(bases.begin(), bases.end());
    bases.erase(std::unique(bases.begin(), bases.end()), bases.end());

    if (bases.empty())
        return new_error(assembly_errc::empty_exchange_list);

    model ret("compartments");
    ret.reserve(3u * bases.size(), 4u * bases.size());

    std::string diet, lumen, fecal, id;

    for (const auto base : bases) {
        format(diet, "{}[d]", base);
        format(lumen, "{}[u]", base);
        format(fecal, "{}[fe]", base);

        format(id, "EX_{}", diet);
        mcm_check(ret.add_reaction(
          id, { { diet, -1.0 } }, -default_flux_bound, default_flux_bound));

        format(id, "DUt_{}", base);
        mcm_check(ret.add_reaction(
          id, { { diet, -1.0 }, { lumen, 1.0 } }, 0.0, default_flux_bound));

        format(id, "UFEt_{}", base);
        mcm_check(ret.add_reaction(
          id, { { lumen, -1.0 }, { fecal, 1.0 } }, 0.0, default_flux_bound));

        format(id, "EX_{}", fecal);
        mcm_check(ret.add_reaction(
          id, { { fecal, -1.0 } }, -default_flux_bound, default_flux_bound));
    }

    return ret;
}

std::vector<std::string> collect_lumen_metabolites(const model& community)
{
    std::vector<std::string> ret;

    for (const auto& id : community.metabolites())
        if (compartment_of(id) == compartment::lumen)
            ret.emplace_back(fmt::format("{}[e]", base_name(id)));

    std::sort(ret.begin(), ret.end());
    return ret;
}

result<model> assemble_community(const assembly_parameters&   params,
                                 const model_loader&          load,
                                 const model*                 host,
                                 std::span<const std::string> exchanges,
                                 journal_handler*             jn)
{
    mcm_auto(community, merge_organisms(params, load, jn));

    std::vector<std::string> metabolites(exchanges.begin(), exchanges.end());
    if (metabolites.empty())
        metabolites = collect_lumen_metabolites(community);

    if (host) {
        auto host_metabolites = host_exchange_metabolites(*host);
        metabolites.insert(metabolites.end(),
                           std::make_move_iterator(host_metabolites.begin()),
                           std::make_move_iterator(host_metabolites.end()));

        mcm_auto(adapted, adapt_host(*host));
        mcm_check(merge_into(
          community, adapted, merge_mode::disjoint, params.merge_genes));
    }

    mcm_auto(compartments,
             build_compartments(metabolites, params.objective_reaction));
    mcm_check(merge_into(
      community, compartments, merge_mode::disjoint, params.merge_genes));

    community.name = "setup";

    if (jn)
        jn->push(log_level::notice, [&](auto& title, auto& msg) {
            format(title, "Community assembled");
            format(msg,
                   "{} organisms{}, {} metabolites, {} reactions",
                   params.organisms.size(),
                   host ? " and host" : "",
                   community.metabolite_count(),
                   community.reaction_count());
        });

    return community;
}

} // namespace mcm
