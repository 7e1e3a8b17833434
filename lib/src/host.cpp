// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <microcosm/assembly.hpp>
#include <microcosm/format.hpp>

#include <algorithm>

namespace mcm {

static constexpr std::string_view host_prefix = "Host_";

static bool touches_extracellular(const model& m, const i32 rxn) noexcept
{
    const auto& col = m.stoichiometry(rxn);

    return std::any_of(col.begin(), col.end(), [&](const auto& c) {
        return compartment_of(m.metabolite(c.row)) ==
               compartment::extracellular;
    });
}

std::vector<std::string> host_exchange_metabolites(const model& host)
{
    std::vector<std::string> ret;

    for (i32 j = 0, e = host.reaction_count(); j != e; ++j) {
        if (not host.reaction(j).starts_with("EX_") or
            host.role(j) == reaction_role::biomass)
            continue;

        for (const auto& c : host.stoichiometry(j))
            if (const auto& id = host.metabolite(c.row);
                compartment_of(id) == compartment::extracellular)
                ret.emplace_back(id);
    }

    std::sort(ret.begin(), ret.end());
    ret.erase(std::unique(ret.begin(), ret.end()), ret.end());

    return ret;
}

/* Copy of the reactions touching an extracellular metabolite over a body
 * fluid compartment: @c EX_glc_D[e] gives @c Host_EX_glc_D[e]b over @c
 * Host_glc_D[b]. */
static result<model> build_body_fluid(const model& host)
{
    model ret("host-body-fluid");

    std::vector<std::string>   names;
    std::vector<reaction_term> terms;
    std::string                id;

    for (i32 j = 0, e = host.reaction_count(); j != e; ++j) {
        if (not touches_extracellular(host, j))
            continue;

        const auto& col = host.stoichiometry(j);

        names.clear();
        for (const auto& c : col)
            names.emplace_back(fmt::format(
              "{}{}", host_prefix, replace_all(host.metabolite(c.row), "[e]", "[b]")));

        terms.clear();
        for (sz i = 0; i < col.size(); ++i)
            terms.emplace_back(reaction_term{ names[i], col[i].value });

        format(id, "{}{}b", host_prefix, host.reaction(j));
        mcm_check(ret.add_reaction(id,
                                   std::span<const reaction_term>(terms),
                                   host.lower_bound(j),
                                   host.upper_bound(j),
                                   host.objective(j)));
    }

    return ret;
}

/* Each remaining @c Host_<m>[e] is linked to the shared lumen metabolite @c
 * <m>[u] by @c Host_IEX_<m>[u]tr. */
static result<model> build_lumen_link(const model& host)
{
    model       ret("host-lumen");
    std::string lumen, id;

    for (const auto& met : host.metabolites()) {
        if (compartment_of(met) != compartment::extracellular)
            continue;

        auto name = std::string_view(met);
        if (name.starts_with(host_prefix))
            name.remove_prefix(host_prefix.size());

        lumen = replace_all(name, "[e]", "[u]");
        format(id, "{}IEX_{}tr", host_prefix, lumen);

        mcm_check(ret.add_reaction(id,
                                   { { met, -1.0 }, { lumen, 1.0 } },
                                   -default_flux_bound,
                                   default_flux_bound));
    }

    return ret;
}

result<model> adapt_host(const model& host)
{
    mcm_auto(body_fluid, build_body_fluid(host));

    model ret = host;
    ret.genes.reset();
    ret.remove_reactions(
      [&](const i32 j) { return ret.reaction(j).starts_with("EX_"); });
    ret.prefix_identifiers(host_prefix);

    mcm_check(merge_into(ret, body_fluid, merge_mode::glue));

    mcm_auto(lumen, build_lumen_link(ret));
    mcm_check(merge_into(ret, lumen, merge_mode::glue));

    ret.name = fmt::format("{}{}", host_prefix, host.name);

    return ret;
}

} // namespace mcm
