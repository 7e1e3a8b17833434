// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_ASSEMBLY_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_ASSEMBLY_HPP

#include <microcosm/global.hpp>
#include <microcosm/merge.hpp>
#include <microcosm/model.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mcm {

//! @return the metabolite excluded from the compartments for the organism
//! objective reaction @a objective_reaction: @c EX_biomass(e) gives @c
//! biomass.
std::string_view biomass_base_name(std::string_view objective_reaction) noexcept;

/**
 * Build the diet @c [d], lumen @c [u] and fecal @c [fe] compartments. For
 * each extracellular metabolite @c m[e] of @a exchanges (duplicates are
 * ignored), the model gets the metabolites @c m[d], @c m[u] and @c m[fe]
 * and four contiguous reactions:
 *
 * - @c EX_m[d]: @c m[d] <=>, bounds [-1000, 1000],
 * - @c DUt_m: @c m[d] -> @c m[u], bounds [0, 1000],
 * - @c UFEt_m: @c m[u] -> @c m[fe], bounds [0, 1000],
 * - @c EX_m[fe]: @c m[fe] <=>, bounds [-1000, 1000].
 *
 * The biomass metabolite of @a objective_reaction is excluded.
 */
result<model> build_compartments(std::span<const std::string> exchanges,
                                 std::string_view objective_reaction);

//! @return the sorted extracellular metabolites of the exchange reactions
//! of @a host (biomass reactions excluded).
std::vector<std::string> host_exchange_metabolites(const model& host);

/**
 * Couple a host model to the community. Reactions touching an @c [e]
 * metabolite are copied into a body fluid @c [b] compartment (@c
 * Host_<rxn>b), the @c EX_ reactions are removed, every identifier is
 * prefixed with @c Host_ and each remaining @c Host_<m>[e] metabolite is
 * linked to the shared lumen metabolite @c <m>[u] by @c Host_IEX_<m>[u]tr.
 */
result<model> adapt_host(const model& host);

//! @return the @c [e] identifiers of the lumen connector metabolites @c
//! m[u] of @a community, sorted.
std::vector<std::string> collect_lumen_metabolites(const model& community);

/**
 * Assemble the setup model: merge the organism models (@c merge_organisms),
 * then the adapted host (if @a host is not null) and finally the
 * compartment model, in this order. The compartments are built from @a
 * exchanges or, if empty, from the lumen metabolites of the community and
 * the host exchange metabolites.
 */
result<model> assemble_community(const assembly_parameters&   params,
                                 const model_loader&          load,
                                 const model*                 host,
                                 std::span<const std::string> exchanges,
                                 journal_handler*             jn = nullptr);

/**
 * Relative abundances of organisms (rows) per sample (columns) read from a
 * CSV file: the header line holds an organism column label followed by the
 * sample identifiers.
 */
struct abundance_table {
    std::vector<std::string> organisms;
    std::vector<std::string> samples;
    std::vector<real>        values; //!< row major, organisms x samples.

    real at(sz organism, sz sample) const noexcept
    {
        return values[organism * samples.size() + sample];
    }

    std::optional<sz> find_sample(std::string_view id) const noexcept;
};

result<abundance_table> read_abundance_file(
  const std::filesystem::path& path);

status read_abundance_buffer(abundance_table& table, std::string_view buffer);

/**
 * Build the community model of a sample from the setup model. Organisms
 * with a null abundance are removed (reactions prefixed by @c <organism>_
 * and the metabolites no longer used), abundances are normalized and the
 * community biomass is added:
 *
 * - @c communityBiomass: @c -a_i <organism_i>_biomass[c] -> @c
 *   microbeBiomass[u],
 * - @c UFEt_microbeBiomass: @c microbeBiomass[u] -> @c microbeBiomass[fe],
 * - @c EX_microbeBiomass[fe]: @c microbeBiomass[fe] <=>.
 */
result<model> personalize_community(const model&                 setup,
                                    std::span<const std::string> organisms,
                                    std::span<const real>        abundances);

} // namespace mcm

#endif
