// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_CONSTRAINT_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_CONSTRAINT_HPP

#include <microcosm/global.hpp>
#include <microcosm/io.hpp>
#include <microcosm/model.hpp>

#include <span>
#include <string_view>

namespace mcm {

//! Upper bound of the transport, fecal and diet exchange reactions.
inline constexpr real open_flux_bound = 1.e6;

//! Lower bound of the host community biomass.
inline constexpr real host_biomass_lower_bound = 0.001;

//! A metabolite of the gut with a fixed minimum uptake.
struct fixed_uptake {
    std::string_view metabolite;
    real             value;
};

//! Host derived metabolites of the gut. In the diet, @c Diet_EX_<m>[d] gets
//! the lower bound @c value. With a host, @c Host_IEX_<m>[u]tr gets the
//! lower bound -1000.
inline constexpr fixed_uptake human_metabolites[] = {
    { "gchola", -10.0 },      { "tdchola", -10.0 },    { "tchola", -10.0 },
    { "dgchol", -10.0 },      { "34dhphe", -10.0 },    { "5htrp", -10.0 },
    { "Lkynr", -10.0 },       { "f1a", -1.0 },         { "gncore1", -1.0 },
    { "gncore2", -1.0 },      { "dsT_antigen", -1.0 }, { "sTn_antigen", -1.0 },
    { "core8", -1.0 },        { "core7", -1.0 },       { "core5", -1.0 },
    { "core4", -1.0 },        { "ha", -1.0 },          { "cspg_a", -1.0 },
    { "cspg_b", -1.0 },       { "cspg_c", -1.0 },      { "cspg_d", -1.0 },
    { "cspg_e", -1.0 },       { "hspg", -1.0 },
};

//! Host blood exchanges kept open for uptake (lower bound -100).
inline constexpr std::string_view host_uptake_metabolites[] = {
    "h2o",
    "hco3",
    "o2",
};

inline constexpr real host_uptake_bound = -100.0;

/**
 * Apply the base rule set to a copy of @a community:
 *
 * 1. lower bound 0 on every biomass reaction,
 * 2. for every organism of @c communityBiomass, lower bounds 0 on the
 *    demand reactions @c <organism>_DM_ and -1 on the sink reactions @c
 *    <organism>_sink_,
 * 3. objective @c EX_microbeBiomass[fe],
 * 4. diet exchanges @c EX_<m>[d] renamed @c Diet_EX_<m>[d],
 * 5. @c communityBiomass bounds [lower_biomass_bound, 1],
 * 6. upper bound 1e6 on transport, fecal exchange and diet exchange
 *    reactions,
 * 7. with a host, the host exchange and biomass bounds.
 *
 * The result is the model of the rich scenario.
 */
result<model> apply_base_constraints(const model&            community,
                                     const batch_parameters& params);

//! Rule 7 on @a m. Called by @c apply_base_constraints.
status apply_host_constraints(model& m, const host_parameters& host);

/**
 * Apply a diet to @a m: every diet exchange lower bound is closed to 0 then
 * the lower bounds of the reactions of @a diet are set. Unknown reactions
 * are ignored. With @a include_human_metabolites, the @c human_metabolites
 * fixed uptakes are set too.
 *
 * @return the number of diet reactions not found in @a m.
 */
int apply_diet(model&            m,
               const diet_table& diet,
               bool              include_human_metabolites);

//! @return the fecal exchange reactions of @a m (@c EX_microbeBiomass[fe]
//! excluded) in model order.
std::vector<i32> fecal_exchanges(const model& m);

//! @return for each reaction of @a fecal (@c EX_<m>[fe]) the diet exchange
//! @c Diet_EX_<m>[d] or @c EX_<m>[d] of @a m, or -1 if it does not exist.
std::vector<i32> paired_diet_exchanges(const model&         m,
                                       std::span<const i32> fecal);

} // namespace mcm

#endif
